/********************************************************************
 * kvp-slot.hpp - uninterpreted key/value slots                    *
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

/** @file kvp-slot.hpp
 *  Accounts, transactions and splits carry a list of key/value slots. The
 *  engine interprets only a handful of keys:
 *  @li account: "placeholder", "hidden"
 *  @li transaction: "notes", "date-posted"
 *  @li split: "online_id"
 *
 *  Every other slot is kept as a KvpSlot holding the slot's value element as
 *  read, and is written back unchanged when its owner is re-serialized.
 */

#ifndef CB_KVP_SLOT_HPP
#define CB_KVP_SLOT_HPP

#include <string>
#include <utility>
#include <vector>

/** An element of a slot value: its qualified name, attributes, text and
 * child elements. Slot values never have mixed content. */
struct KvpNode
{
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string text;
    std::vector<KvpNode> children;
};

struct KvpSlot
{
    std::string key;
    /** The slot:value element. */
    KvpNode value;
};

using KvpSlots = std::vector<KvpSlot>;

inline bool operator==(const KvpNode& a, const KvpNode& b)
{
    return a.name == b.name && a.attributes == b.attributes &&
        a.text == b.text && a.children == b.children;
}

inline bool operator!=(const KvpNode& a, const KvpNode& b) { return !(a == b); }

inline bool operator==(const KvpSlot& a, const KvpSlot& b)
{
    return a.key == b.key && a.value == b.value;
}

inline bool operator!=(const KvpSlot& a, const KvpSlot& b) { return !(a == b); }

#endif // CB_KVP_SLOT_HPP
