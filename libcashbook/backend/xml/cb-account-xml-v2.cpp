/********************************************************************
 * cb-account-xml-v2.cpp -- xml routines for accounts              *
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

#include "cb-xml.hpp"
#include "cb-errors.hpp"
#include "sixtp-dom-generators.hpp"
#include "sixtp-dom-parsers.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_BACKEND;

const char* account_version_string = "2.0.0";

/* ids */
#define gnc_account_string "gnc:account"
#define act_name_string "act:name"
#define act_id_string "act:id"
#define act_type_string "act:type"
#define act_commodity_string "act:commodity"
#define act_commodity_scu_string "act:commodity-scu"
#define act_code_string "act:code"
#define act_description_string "act:description"
#define act_slots_string "act:slots"
#define act_parent_string "act:parent"

xmlNodePtr
cb_account_dom_tree_create (const Account& act)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST gnc_account_string);
    xmlSetProp (ret, BAD_CAST "version", BAD_CAST account_version_string);

    xmlAddChild (ret, text_to_dom_tree (act_name_string, act.name));
    xmlAddChild (ret, guid_to_dom_tree (act_id_string, act.id));
    xmlAddChild (ret, text_to_dom_tree (act_type_string,
                                        cb_account_type_to_string (act.type)));

    /* xmlAddChild won't do anything with a NULL, so tests are superfluous. */
    if (act.commodity)
        xmlAddChild (ret, commodity_ref_to_dom_tree (act_commodity_string,
                                                     *act.commodity));
    if (act.commodity_scu)
        xmlAddChild (ret, int_to_dom_tree (act_commodity_scu_string,
                                           *act.commodity_scu));

    if (!act.code.empty())
        xmlAddChild (ret, text_to_dom_tree (act_code_string, act.code));
    if (!act.description.empty())
        xmlAddChild (ret, text_to_dom_tree (act_description_string,
                                            act.description));

    if (act.placeholder || act.hidden || !act.other_slots.empty())
    {
        auto slots = xmlNewChild (ret, nullptr, BAD_CAST act_slots_string,
                                  nullptr);
        if (act.placeholder)
            add_string_slot (slots, "placeholder", "true");
        if (act.hidden)
            add_string_slot (slots, "hidden", "true");
        add_kvp_slots (slots, act.other_slots);
    }

    if (act.parent)
        xmlAddChild (ret, guid_to_dom_tree (act_parent_string, *act.parent));

    return ret;
}

/***********************************************************************/

static inline bool
set_string (xmlNodePtr node, std::string& field)
{
    auto txt = dom_tree_to_text (node);
    if (!txt)
        return false;
    field = *txt;
    return true;
}

static bool
account_id_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    act->id = dom_tree_to_trimmed_text (node);
    return !act->id.empty();
}

static bool
account_name_handler (xmlNodePtr node, gpointer act_pdata)
{
    return set_string (node, static_cast<Account*> (act_pdata)->name);
}

static bool
account_type_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    auto str = dom_tree_to_trimmed_text (node);
    if (!cb_account_string_to_type (str, &act->type))
    {
        PERR ("unknown account type %s", str.c_str());
        return false;
    }
    return true;
}

static bool
account_commodity_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    act->commodity = dom_tree_to_commodity_ref (node);
    return true;
}

static bool
account_commodity_scu_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    auto str = dom_tree_to_trimmed_text (node);
    gchar* end = nullptr;
    auto val = g_ascii_strtoll (str.c_str(), &end, 10);
    if (str.empty() || (end && *end))
    {
        PERR ("bad commodity-scu %s", str.c_str());
        return false;
    }
    act->commodity_scu = val;
    return true;
}

static bool
account_code_handler (xmlNodePtr node, gpointer act_pdata)
{
    return set_string (node, static_cast<Account*> (act_pdata)->code);
}

static bool
account_description_handler (xmlNodePtr node, gpointer act_pdata)
{
    return set_string (node, static_cast<Account*> (act_pdata)->description);
}

static bool
account_slot_handler (const std::string& key, xmlNodePtr value, gpointer data)
{
    auto act = static_cast<Account*> (data);
    if (key == "placeholder")
        act->placeholder = dom_tree_to_trimmed_text (value) == "true";
    else if (key == "hidden")
        act->hidden = dom_tree_to_trimmed_text (value) == "true";
    else
        return false;
    return true;
}

static bool
account_slots_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    dom_tree_for_each_slot (node, account_slot_handler, act, act->other_slots);
    return true;
}

static bool
account_parent_handler (xmlNodePtr node, gpointer act_pdata)
{
    auto act = static_cast<Account*> (act_pdata);
    auto parent = dom_tree_to_trimmed_text (node);
    if (parent.empty())
        return false;
    act->parent = parent;
    return true;
}

static struct dom_tree_handler account_handlers_v2[] =
{
    { act_name_string, account_name_handler, 1, 0 },
    { act_id_string, account_id_handler, 1, 0 },
    { act_type_string, account_type_handler, 1, 0 },
    { act_commodity_string, account_commodity_handler, 0, 0 },
    { act_commodity_scu_string, account_commodity_scu_handler, 0, 0 },
    { act_code_string, account_code_handler, 0, 0 },
    { act_description_string, account_description_handler, 0, 0},
    { act_slots_string, account_slots_handler, 0, 0 },
    { act_parent_string, account_parent_handler, 0, 0 },
    { NULL, 0, 0, 0 }
};

std::optional<Account>
dom_tree_to_account (xmlNodePtr node)
{
    Account act;
    if (!dom_tree_generic_parse (node, account_handlers_v2, &act))
    {
        PERR ("failed to parse account %s", act.id.c_str());
        return std::nullopt;
    }
    return act;
}

std::string
cb_account_to_xml_string (const Account& act)
{
    auto node = cb_account_dom_tree_create (act);
    auto text = dom_tree_to_string (node);
    xmlFreeNode (node);
    if (text.empty ())
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR,
                            "Unable to serialize account " + act.id, act.id,
                            "write");
    return text;
}
