/********************************************************************
 * sixtp-dom-parsers.hpp                                           *
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


#ifndef CB_SIXTP_DOM_PARSERS_HPP
#define CB_SIXTP_DOM_PARSERS_HPP

#include <glib.h>
#include <libxml/tree.h>
#include <optional>
#include <string>

#include "Account.hpp"
#include "cb-datetime.hpp"
#include "cb-numeric.hpp"
#include "kvp-slot.hpp"

/** The qualified name of @a node, "prefix:local" if it has a namespace. */
std::string dom_tree_qname (xmlNodePtr node);

/** The concatenated text content of @a node, or nullopt if it has element
 * children. */
std::optional<std::string> dom_tree_to_text (xmlNodePtr node);
/** The text of @a node with surrounding whitespace removed. */
std::string dom_tree_to_trimmed_text (xmlNodePtr node);

/** The date of the <ts:date> child, time of day dropped.
 * @exception std::invalid_argument if there's none or it isn't a date. */
CbDate dom_tree_to_date (xmlNodePtr node);
/** The date of the <gdate> child.
 * @exception std::invalid_argument if there's none or it isn't a date. */
CbDate dom_tree_to_gdate (xmlNodePtr node);
/** @exception std::invalid_argument if the text isn't a number. */
CbNumeric dom_tree_to_numeric (xmlNodePtr node);
/** The <cmdty:space> and <cmdty:id> children. */
CbCommodityRef dom_tree_to_commodity_ref (xmlNodePtr node);
/** Copy an element verbatim. */
KvpNode dom_tree_to_kvp_node (xmlNodePtr node);

/** Called for each <slot> by dom_tree_for_each_slot() with its key and its
 * <slot:value> element. Return false to keep the slot in @a other. */
using SlotHandler = bool (*) (const std::string& key, xmlNodePtr value,
                              gpointer data);

/** Walk the <slot> children of a *:slots element, offering each to
 * @a handler and copying the ones it declines into @a other. */
void dom_tree_for_each_slot (xmlNodePtr node, SlotHandler handler,
                             gpointer data, KvpSlots& other);

struct dom_tree_handler
{
    const char* tag;

    bool (*handler) (xmlNodePtr, gpointer data);

    int required;
    int gotten;
};

/** Dispatch each element child of @a node to the handler whose tag matches
 * its qualified name.
 *
 * @return false if a handler failed or a required tag was missing. Unknown
 * tags are logged and skipped.
 */
bool dom_tree_generic_parse (xmlNodePtr node, struct dom_tree_handler* handlers,
                             gpointer data);

#endif /* CB_SIXTP_DOM_PARSERS_HPP */
