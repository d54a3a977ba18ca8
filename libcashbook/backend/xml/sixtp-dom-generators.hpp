/********************************************************************
 * sixtp-dom-generators.hpp                                        *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 *******************************************************************/

/** @file sixtp-dom-generators.hpp
 *  Builders for the libxml2 nodes of the ledger vocabulary. Element names are
 *  the qualified names used by the file ("act:name", "ts:date"); the
 *  namespace declarations live on the document's root element, which the
 *  writer never touches.
 */

#ifndef CB_SIXTP_DOM_GENERATORS_HPP
#define CB_SIXTP_DOM_GENERATORS_HPP

#include <libxml/tree.h>
#include <string>

#include "Account.hpp"
#include "cb-datetime.hpp"
#include "cb-numeric.hpp"
#include "kvp-slot.hpp"

xmlNodePtr text_to_dom_tree (const char* tag, const std::string& str);
xmlNodePtr int_to_dom_tree (const char* tag, int64_t val);
xmlNodePtr guid_to_dom_tree (const char* tag, const std::string& guid);
xmlNodePtr commodity_ref_to_dom_tree (const char* tag, const CbCommodityRef& c);
/** <tag><ts:date>YYYY-MM-DD 10:59:00 +0000</ts:date></tag> */
xmlNodePtr date_to_dom_tree (const char* tag, const CbDate& date);
/** <tag><ts:date>YYYY-MM-DD HH:MM:SS +0000</ts:date></tag> */
xmlNodePtr datetime_to_dom_tree (const char* tag, const CbDateTime& time);
/** <tag><gdate>YYYY-MM-DD</gdate></tag> */
xmlNodePtr gdate_to_dom_tree (const char* tag, const CbDate& date);
/** The value as whole cents, "N/100". */
xmlNodePtr amount_to_dom_tree (const char* tag, const CbNumeric& num);

/** Rebuild an element kept verbatim from a slot. */
xmlNodePtr kvp_node_to_dom_tree (const KvpNode& node);
/** Append <slot><slot:key>key</slot:key><slot:value type="string">..
 * </slot:value></slot> to @a slots. */
void add_string_slot (xmlNodePtr slots, const char* key, const std::string& val);
/** Append <slot> with a gdate value to @a slots. */
void add_gdate_slot (xmlNodePtr slots, const char* key, const CbDate& date);
/** Append the uninterpreted @a other slots to @a slots. */
void add_kvp_slots (xmlNodePtr slots, const KvpSlots& other);

/** Serialize @a node and its children, indented, without an XML
 * declaration. */
std::string dom_tree_to_string (xmlNodePtr node);

#endif /* CB_SIXTP_DOM_GENERATORS_HPP */
