/********************************************************************
 * sixtp-dom-parsers.cpp                                           *
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


#include <glib.h>
#include <boost/algorithm/string/trim.hpp>
#include <cstring>

#include "sixtp-dom-parsers.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

std::string
dom_tree_qname (xmlNodePtr node)
{
    std::string name{reinterpret_cast<const char*> (node->name)};
    if (node->ns && node->ns->prefix)
        return std::string{reinterpret_cast<const char*> (node->ns->prefix)} +
            ":" + name;
    return name;
}

std::optional<std::string>
dom_tree_to_text (xmlNodePtr node)
{
    std::string text;
    for (auto child = node->children; child; child = child->next)
    {
        switch (child->type)
        {
        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE:
            if (child->content)
                text += reinterpret_cast<const char*> (child->content);
            break;
        case XML_ELEMENT_NODE:
            PERR ("<%s> has element content where text was expected",
                  node->name);
            return std::nullopt;
        default:
            break;
        }
    }
    return text;
}

std::string
dom_tree_to_trimmed_text (xmlNodePtr node)
{
    auto text = dom_tree_to_text (node);
    if (!text)
        return {};
    return boost::algorithm::trim_copy (*text);
}

static xmlNodePtr
find_child (xmlNodePtr node, const char* qname)
{
    for (auto child = node->children; child; child = child->next)
        if (child->type == XML_ELEMENT_NODE && dom_tree_qname (child) == qname)
            return child;
    return nullptr;
}

CbDate
dom_tree_to_date (xmlNodePtr node)
{
    auto ts = find_child (node, "ts:date");
    if (!ts)
        throw std::invalid_argument{std::string{"no <ts:date> in <"} +
                reinterpret_cast<const char*> (node->name) + ">"};
    return CbDate::from_iso (dom_tree_to_trimmed_text (ts));
}

CbDate
dom_tree_to_gdate (xmlNodePtr node)
{
    auto gdate = find_child (node, "gdate");
    if (!gdate)
        throw std::invalid_argument{std::string{"no <gdate> in <"} +
                reinterpret_cast<const char*> (node->name) + ">"};
    return CbDate::from_iso (dom_tree_to_trimmed_text (gdate));
}

CbNumeric
dom_tree_to_numeric (xmlNodePtr node)
{
    return cb_numeric_from_fraction (dom_tree_to_trimmed_text (node));
}

CbCommodityRef
dom_tree_to_commodity_ref (xmlNodePtr node)
{
    CbCommodityRef ref;
    if (auto space = find_child (node, "cmdty:space"))
        ref.space = dom_tree_to_trimmed_text (space);
    if (auto id = find_child (node, "cmdty:id"))
        ref.id = dom_tree_to_trimmed_text (id);
    if (ref.space.empty() || ref.id.empty())
        PWARN ("incomplete commodity reference in <%s>", node->name);
    return ref;
}

KvpNode
dom_tree_to_kvp_node (xmlNodePtr node)
{
    KvpNode kvp;
    kvp.name = dom_tree_qname (node);
    for (auto attr = node->properties; attr; attr = attr->next)
    {
        auto value = xmlGetProp (node, attr->name);
        std::string name{reinterpret_cast<const char*> (attr->name)};
        if (attr->ns && attr->ns->prefix)
            name = std::string{reinterpret_cast<const char*> (attr->ns->prefix)} +
                ":" + name;
        kvp.attributes.emplace_back (name, value ?
                                     reinterpret_cast<const char*> (value) : "");
        xmlFree (value);
    }
    for (auto child = node->children; child; child = child->next)
    {
        if (child->type == XML_ELEMENT_NODE)
            kvp.children.push_back (dom_tree_to_kvp_node (child));
        else if ((child->type == XML_TEXT_NODE ||
                  child->type == XML_CDATA_SECTION_NODE) && child->content)
            kvp.text += reinterpret_cast<const char*> (child->content);
    }
    /* Indentation between child elements isn't content. */
    if (!kvp.children.empty())
        kvp.text.clear();
    return kvp;
}

void
dom_tree_for_each_slot (xmlNodePtr node, SlotHandler handler, gpointer data,
                        KvpSlots& other)
{
    for (auto slot = node->children; slot; slot = slot->next)
    {
        if (slot->type != XML_ELEMENT_NODE)
            continue;
        if (dom_tree_qname (slot) != "slot")
        {
            PWARN ("unexpected <%s> in <%s>", slot->name, node->name);
            continue;
        }
        auto key_node = find_child (slot, "slot:key");
        auto value_node = find_child (slot, "slot:value");
        if (!key_node || !value_node)
        {
            PWARN ("slot without a key or value in <%s>", node->name);
            continue;
        }
        auto key = dom_tree_to_trimmed_text (key_node);
        if (handler && handler (key, value_node, data))
            continue;
        other.push_back (KvpSlot{key, dom_tree_to_kvp_node (value_node)});
    }
}

static bool
dom_tree_handlers_all_gotten_p (dom_tree_handler* handlers)
{
    bool ret = true;
    for (auto itr = handlers; itr->tag != nullptr; itr++)
    {
        if (itr->required && !itr->gotten)
        {
            PERR ("Not defined and it should be: %s", itr->tag);
            ret = false;
        }
    }
    return ret;
}

static bool
cb_xml_set_data (const std::string& tag, xmlNodePtr node, gpointer item,
                  dom_tree_handler* handlers)
{
    for (auto itr = handlers; itr->tag != nullptr; itr++)
    {
        if (tag == itr->tag)
        {
            itr->gotten = TRUE;
            return itr->handler (node, item);
        }
    }
    PWARN ("Unhandled tag: %s", tag.c_str());
    return true;
}

bool
dom_tree_generic_parse (xmlNodePtr node, dom_tree_handler* handlers,
                        gpointer data)
{
    for (auto itr = handlers; itr->tag != nullptr; itr++)
        itr->gotten = 0;

    bool successful = true;
    for (auto achild = node->xmlChildrenNode; achild; achild = achild->next)
    {
        /* ignore stray text nodes */
        if (achild->type != XML_ELEMENT_NODE)
            continue;

        if (!cb_xml_set_data (dom_tree_qname (achild), achild, data, handlers))
        {
            PERR ("cb_xml_set_data failed for <%s>", achild->name);
            successful = false;
            break;
        }
    }

    if (successful && !dom_tree_handlers_all_gotten_p (handlers))
        successful = false;

    return successful;
}
