/********************************************************************
 * cb-transaction-xml-v2.cpp -- xml routines for transactions      *
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

const char* transaction_version_string = "2.0.0";

/* Quantities finer than a cent belong to commodity splits and are kept as
 * read; everything else goes through the cents codec. */
static xmlNodePtr
quantity_to_dom_tree (const char* tag, const CbNumeric& num)
{
    if (num.denom() > CB_AMOUNT_DENOM)
        return text_to_dom_tree (tag, num.to_string());
    return amount_to_dom_tree (tag, num);
}

static xmlNodePtr
split_to_dom_tree (const char* tag, const Split& spl)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST tag);

    xmlAddChild (ret, guid_to_dom_tree ("split:id", spl.id));

    if (!spl.memo.empty())
        xmlAddChild (ret, text_to_dom_tree ("split:memo", spl.memo));
    if (!spl.action.empty())
        xmlAddChild (ret, text_to_dom_tree ("split:action", spl.action));

    {
        char tmp[2];

        tmp[0] = spl.reconciled;
        tmp[1] = '\0';

        xmlNewTextChild (ret, nullptr, BAD_CAST "split:reconciled-state",
                         BAD_CAST tmp);
    }

    if (spl.reconcile_date)
        xmlAddChild (ret, date_to_dom_tree ("split:reconcile-date",
                                            *spl.reconcile_date));

    xmlAddChild (ret, amount_to_dom_tree ("split:value", spl.value));
    xmlAddChild (ret, quantity_to_dom_tree ("split:quantity", spl.quantity));
    xmlAddChild (ret, guid_to_dom_tree ("split:account", spl.account));

    if (!spl.lot.empty())
        xmlAddChild (ret, guid_to_dom_tree ("split:lot", spl.lot));

    if (spl.online_id || !spl.other_slots.empty())
    {
        auto slots = xmlNewChild (ret, nullptr, BAD_CAST "split:slots", nullptr);
        if (spl.online_id)
            add_string_slot (slots, "online_id", *spl.online_id);
        add_kvp_slots (slots, spl.other_slots);
    }
    return ret;
}

static void
add_trans_splits (xmlNodePtr node, const Transaction& trn)
{
    auto toaddto = xmlNewChild (node, nullptr, BAD_CAST "trn:splits", nullptr);

    for (const auto& s : trn.splits)
        xmlAddChild (toaddto, split_to_dom_tree ("trn:split", s));
}

xmlNodePtr
cb_transaction_dom_tree_create (const Transaction& trn)
{
    auto ret = xmlNewNode (nullptr, BAD_CAST "gnc:transaction");

    xmlSetProp (ret, BAD_CAST "version",
                BAD_CAST transaction_version_string);

    xmlAddChild (ret, guid_to_dom_tree ("trn:id", trn.id));

    /* xmlAddChild won't do anything with a NULL, so tests are superfluous. */
    xmlAddChild (ret, commodity_ref_to_dom_tree ("trn:currency", trn.currency));

    if (!trn.num.empty())
        xmlAddChild (ret, text_to_dom_tree ("trn:num", trn.num));

    xmlAddChild (ret, date_to_dom_tree ("trn:date-posted", trn.date_posted));
    if (trn.date_entered)
        xmlAddChild (ret, date_to_dom_tree ("trn:date-entered",
                                            *trn.date_entered));
    else
        xmlAddChild (ret, datetime_to_dom_tree ("trn:date-entered",
                                                CbDateTime{}));

    xmlAddChild (ret, text_to_dom_tree ("trn:description", trn.description));

    auto slots = xmlNewChild (ret, nullptr, BAD_CAST "trn:slots", nullptr);
    add_gdate_slot (slots, "date-posted", trn.date_posted);
    if (!trn.notes.empty())
        add_string_slot (slots, "notes", trn.notes);
    add_kvp_slots (slots, trn.other_slots);

    add_trans_splits (ret, trn);

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

static inline bool
set_guid (xmlNodePtr node, std::string& field)
{
    field = dom_tree_to_trimmed_text (node);
    return !field.empty();
}

static inline bool
set_numeric (xmlNodePtr node, CbNumeric& field)
{
    try
    {
        field = dom_tree_to_numeric (node);
    }
    catch (const std::invalid_argument& err)
    {
        PERR ("<%s>: %s", node->name, err.what());
        return false;
    }
    return true;
}

static inline bool
set_date (xmlNodePtr node, CbDate& field)
{
    try
    {
        field = dom_tree_to_date (node);
    }
    catch (const std::invalid_argument& err)
    {
        PERR ("<%s>: %s", node->name, err.what());
        return false;
    }
    return true;
}

static bool
spl_id_handler (xmlNodePtr node, gpointer data)
{
    return set_guid (node, static_cast<Split*> (data)->id);
}

static bool
spl_memo_handler (xmlNodePtr node, gpointer data)
{
    return set_string (node, static_cast<Split*> (data)->memo);
}

static bool
spl_action_handler (xmlNodePtr node, gpointer data)
{
    return set_string (node, static_cast<Split*> (data)->action);
}

static bool
spl_reconciled_state_handler (xmlNodePtr node, gpointer data)
{
    auto spl = static_cast<Split*> (data);
    auto tmp = dom_tree_to_trimmed_text (node);
    if (tmp.size() != 1 || !cb_split_reconcile_state_is_valid (tmp[0]))
    {
        PERR ("bad reconciled state '%s'", tmp.c_str());
        return false;
    }
    spl->reconciled = tmp[0];
    return true;
}

static bool
spl_reconcile_date_handler (xmlNodePtr node, gpointer data)
{
    auto spl = static_cast<Split*> (data);
    CbDate date;
    if (!set_date (node, date))
        return false;
    spl->reconcile_date = date;
    return true;
}

static bool
spl_value_handler (xmlNodePtr node, gpointer data)
{
    return set_numeric (node, static_cast<Split*> (data)->value);
}

static bool
spl_quantity_handler (xmlNodePtr node, gpointer data)
{
    return set_numeric (node, static_cast<Split*> (data)->quantity);
}

static bool
spl_account_handler (xmlNodePtr node, gpointer data)
{
    return set_guid (node, static_cast<Split*> (data)->account);
}

static bool
spl_lot_handler (xmlNodePtr node, gpointer data)
{
    return set_guid (node, static_cast<Split*> (data)->lot);
}

static bool
spl_slot_handler (const std::string& key, xmlNodePtr value, gpointer data)
{
    if (key != "online_id")
        return false;
    static_cast<Split*> (data)->online_id = dom_tree_to_trimmed_text (value);
    return true;
}

static bool
spl_slots_handler (xmlNodePtr node, gpointer data)
{
    auto spl = static_cast<Split*> (data);
    dom_tree_for_each_slot (node, spl_slot_handler, spl, spl->other_slots);
    return true;
}

static struct dom_tree_handler spl_dom_handlers[] =
{
    { "split:id", spl_id_handler, 1, 0 },
    { "split:memo", spl_memo_handler, 0, 0 },
    { "split:action", spl_action_handler, 0, 0 },
    { "split:reconciled-state", spl_reconciled_state_handler, 1, 0 },
    { "split:reconcile-date", spl_reconcile_date_handler, 0, 0 },
    { "split:value", spl_value_handler, 1, 0 },
    { "split:quantity", spl_quantity_handler, 1, 0 },
    { "split:account", spl_account_handler, 1, 0 },
    { "split:lot", spl_lot_handler, 0, 0 },
    { "split:slots", spl_slots_handler, 0, 0 },
    { NULL, NULL, 0, 0 },
};

static std::optional<Split>
dom_tree_to_split (xmlNodePtr node)
{
    Split ret;
    if (dom_tree_generic_parse (node, spl_dom_handlers, &ret))
        return ret;
    return std::nullopt;
}

/***********************************************************************/

static bool
trn_id_handler (xmlNodePtr node, gpointer trans_pdata)
{
    return set_guid (node, static_cast<Transaction*> (trans_pdata)->id);
}

static bool
trn_currency_handler (xmlNodePtr node, gpointer trans_pdata)
{
    auto trn = static_cast<Transaction*> (trans_pdata);
    trn->currency = dom_tree_to_commodity_ref (node);
    return true;
}

static bool
trn_num_handler (xmlNodePtr node, gpointer trans_pdata)
{
    return set_string (node, static_cast<Transaction*> (trans_pdata)->num);
}

static bool
trn_date_posted_handler (xmlNodePtr node, gpointer trans_pdata)
{
    return set_date (node, static_cast<Transaction*> (trans_pdata)->date_posted);
}

static bool
trn_date_entered_handler (xmlNodePtr node, gpointer trans_pdata)
{
    auto trn = static_cast<Transaction*> (trans_pdata);
    CbDate date;
    if (!set_date (node, date))
        return false;
    trn->date_entered = date;
    return true;
}

static bool
trn_description_handler (xmlNodePtr node, gpointer trans_pdata)
{
    return set_string (node,
                       static_cast<Transaction*> (trans_pdata)->description);
}

static bool
trn_slot_handler (const std::string& key, xmlNodePtr value, gpointer data)
{
    auto trn = static_cast<Transaction*> (data);
    if (key == "notes")
        trn->notes = dom_tree_to_text (value).value_or ("");
    /* trn:date-posted is authoritative; the slot is rewritten from it. */
    else if (key != "date-posted")
        return false;
    return true;
}

static bool
trn_slots_handler (xmlNodePtr node, gpointer trans_pdata)
{
    auto trn = static_cast<Transaction*> (trans_pdata);
    dom_tree_for_each_slot (node, trn_slot_handler, trn, trn->other_slots);
    return true;
}

static bool
trn_splits_handler (xmlNodePtr node, gpointer trans_pdata)
{
    auto trn = static_cast<Transaction*> (trans_pdata);

    for (auto mark = node->xmlChildrenNode; mark; mark = mark->next)
    {
        if (mark->type != XML_ELEMENT_NODE)
            continue;

        if (dom_tree_qname (mark) != "trn:split")
        {
            PERR ("unexpected <%s> in trn:splits", mark->name);
            return false;
        }

        auto spl = dom_tree_to_split (mark);
        if (!spl)
            return false;
        trn->splits.push_back (std::move (*spl));
    }
    if (trn->splits.empty())
    {
        PERR ("transaction %s has no splits", trn->id.c_str());
        return false;
    }
    return true;
}

static struct dom_tree_handler trn_dom_handlers[] =
{
    { "trn:id", trn_id_handler, 1, 0 },
    { "trn:currency", trn_currency_handler, 0, 0},
    { "trn:num", trn_num_handler, 0, 0 },
    { "trn:date-posted", trn_date_posted_handler, 1, 0 },
    { "trn:date-entered", trn_date_entered_handler, 0, 0 },
    { "trn:description", trn_description_handler, 0, 0 },
    { "trn:slots", trn_slots_handler, 0, 0 },
    { "trn:splits", trn_splits_handler, 1, 0 },
    { NULL, NULL, 0, 0 },
};

std::optional<Transaction>
dom_tree_to_transaction (xmlNodePtr node)
{
    Transaction trn;
    if (!dom_tree_generic_parse (node, trn_dom_handlers, &trn))
    {
        PERR ("failed to parse transaction %s", trn.id.c_str());
        return std::nullopt;
    }
    return trn;
}

std::string
cb_transaction_to_xml_string (const Transaction& trn)
{
    auto node = cb_transaction_dom_tree_create (trn);
    auto text = dom_tree_to_string (node);
    xmlFreeNode (node);
    if (text.empty ())
        throw CbWriteError (ERR_FILEIO_WRITE_ERROR,
                            "Unable to serialize transaction " + trn.id,
                            trn.id, "write");
    return text;
}
