/********************************************************************
 * sixtp-dom-generators.cpp                                        *
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


#include <libxml/tree.h>

#include "sixtp-dom-generators.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

#define BAD_CAST_STR(s) BAD_CAST ((s).c_str())

xmlNodePtr
text_to_dom_tree (const char* tag, const std::string& str)
{
    auto result = xmlNewNode (nullptr, BAD_CAST tag);
    xmlNodeAddContent (result, BAD_CAST_STR (str));
    return result;
}

xmlNodePtr
int_to_dom_tree (const char* tag, int64_t val)
{
    return text_to_dom_tree (tag, std::to_string (val));
}

xmlNodePtr
guid_to_dom_tree (const char* tag, const std::string& guid)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);
    xmlSetProp (ret, BAD_CAST "type", BAD_CAST "guid");
    xmlNodeAddContent (ret, BAD_CAST_STR (guid));
    return ret;
}

xmlNodePtr
commodity_ref_to_dom_tree (const char* tag, const CbCommodityRef& c)
{
    if (c.space.empty() || c.id.empty())
    {
        PWARN ("incomplete commodity reference for %s", tag);
        return nullptr;
    }
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);
    xmlNewTextChild (ret, nullptr, BAD_CAST "cmdty:space", BAD_CAST_STR (c.space));
    xmlNewTextChild (ret, nullptr, BAD_CAST "cmdty:id", BAD_CAST_STR (c.id));
    return ret;
}

xmlNodePtr
date_to_dom_tree (const char* tag, const CbDate& date)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);
    xmlNewTextChild (ret, nullptr, BAD_CAST "ts:date",
                     BAD_CAST_STR (cb_ledger_timestamp (date)));
    return ret;
}

xmlNodePtr
datetime_to_dom_tree (const char* tag, const CbDateTime& time)
{
    auto date_str = time.format_zulu ("%Y-%m-%d %H:%M:%S");
    date_str += " +0000";
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);
    xmlNewTextChild (ret, nullptr, BAD_CAST "ts:date", BAD_CAST_STR (date_str));
    return ret;
}

xmlNodePtr
gdate_to_dom_tree (const char* tag, const CbDate& date)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);
    xmlNewTextChild (ret, nullptr, BAD_CAST "gdate", BAD_CAST_STR (date.iso()));
    return ret;
}

xmlNodePtr
amount_to_dom_tree (const char* tag, const CbNumeric& num)
{
    return text_to_dom_tree (tag, cb_numeric_to_fraction (num));
}

xmlNodePtr
kvp_node_to_dom_tree (const KvpNode& node)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST_STR (node.name));
    for (const auto& attr : node.attributes)
        xmlSetProp (ret, BAD_CAST_STR (attr.first), BAD_CAST_STR (attr.second));
    if (node.children.empty())
        xmlNodeAddContent (ret, BAD_CAST_STR (node.text));
    for (const auto& child : node.children)
        xmlAddChild (ret, kvp_node_to_dom_tree (child));
    return ret;
}

static xmlNodePtr
new_slot (xmlNodePtr slots, const char* key)
{
    auto slot_node = xmlNewChild (slots, nullptr, BAD_CAST "slot", nullptr);
    xmlNewTextChild (slot_node, nullptr, BAD_CAST "slot:key", BAD_CAST key);
    return slot_node;
}

void
add_string_slot (xmlNodePtr slots, const char* key, const std::string& val)
{
    auto slot_node = new_slot (slots, key);
    auto val_node = xmlNewTextChild (slot_node, nullptr, BAD_CAST "slot:value",
                                     BAD_CAST_STR (val));
    xmlSetProp (val_node, BAD_CAST "type", BAD_CAST "string");
}

void
add_gdate_slot (xmlNodePtr slots, const char* key, const CbDate& date)
{
    auto slot_node = new_slot (slots, key);
    auto val_node = gdate_to_dom_tree ("slot:value", date);
    xmlSetProp (val_node, BAD_CAST "type", BAD_CAST "gdate");
    xmlAddChild (slot_node, val_node);
}

void
add_kvp_slots (xmlNodePtr slots, const KvpSlots& other)
{
    for (const auto& slot : other)
    {
        auto slot_node = new_slot (slots, slot.key.c_str());
        xmlAddChild (slot_node, kvp_node_to_dom_tree (slot.value));
    }
}

std::string
dom_tree_to_string (xmlNodePtr node)
{
    auto doc = xmlNewDoc (BAD_CAST "1.0");
    xmlDocSetRootElement (doc, node);
    auto buf = xmlBufferCreate ();
    std::string retval;
    if (xmlNodeDump (buf, doc, node, 0, 1) >= 0)
        retval.assign (reinterpret_cast<const char*> (xmlBufferContent (buf)),
                       xmlBufferLength (buf));
    else
        PERR ("unable to serialize <%s>", node->name);
    xmlBufferFree (buf);
    xmlUnlinkNode (node);
    xmlFreeDoc (doc);
    return retval;
}
