/********************************************************************
 * cb-xlsx-import.cpp - spreadsheet statements                     *
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
#include <glib-object.h>
#include <gsf/gsf-utils.h>
#include <gsf/gsf-input.h>
#include <gsf/gsf-input-memory.h>
#include <gsf/gsf-infile.h>
#include <gsf/gsf-infile-zip.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "cb-xlsx-import.hpp"
#include "cb-errors.hpp"
#include "cb-log.hpp"

static CbLogModule log_module = CB_MOD_XLSX;

using StrVec = std::vector<std::string>;
using GsfInputPtr = std::unique_ptr<GsfInput, decltype (&g_object_unref)>;
using GsfInfilePtr = std::unique_ptr<GsfInfile, decltype (&g_object_unref)>;
using XmlDocPtr = std::unique_ptr<xmlDoc, decltype (&xmlFreeDoc)>;

static void
gsf_init_once (void)
{
    static std::once_flag flag;
    std::call_once (flag, []() { gsf_init (); });
}

/* Read member @a path ("xl/workbook.xml") of @a zip; nullopt if it's not
 * there. */
static std::optional<std::string>
read_member (GsfInfile* zip, const std::string& path)
{
    StrVec parts;
    boost::split (parts, path, boost::is_any_of ("/"), boost::token_compress_on);
    std::vector<const char*> names;
    for (const auto& part : parts)
        if (!part.empty())
            names.push_back (part.c_str());
    names.push_back (nullptr);

    GsfInputPtr member{gsf_infile_child_by_aname (zip, names.data()),
                       &g_object_unref};
    if (!member)
        return std::nullopt;

    auto size = gsf_input_size (member.get());
    std::string data;
    if (size > 0)
    {
        auto bytes = gsf_input_read (member.get(), size, nullptr);
        if (!bytes)
        {
            PWARN ("short read of %s", path.c_str());
            return std::nullopt;
        }
        data.assign (reinterpret_cast<const char*>(bytes), size);
    }
    DEBUG ("%s: %zu bytes", path.c_str(), data.size());
    return data;
}

static XmlDocPtr
parse_part (const std::string& text, const std::string& part,
            const std::string& filename)
{
    XmlDocPtr doc{xmlReadMemory (text.data(), text.size(), part.c_str(), nullptr,
                                 XML_PARSE_NONET | XML_PARSE_HUGE |
                                 XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  &xmlFreeDoc};
    if (!doc || !xmlDocGetRootElement (doc.get()))
    {
        PERR ("%s of %s is not XML", part.c_str(), filename.c_str());
        throw CbImportFormatError (filename, "The workbook's " + part +
                                   " can't be read");
    }
    return doc;
}

static bool
is_element (xmlNodePtr node, const char* name)
{
    return node->type == XML_ELEMENT_NODE &&
        xmlStrcmp (node->name, BAD_CAST name) == 0;
}

static std::string
get_prop (xmlNodePtr node, const char* name)
{
    auto prop = xmlGetProp (node, BAD_CAST name);
    if (!prop)
        return {};
    std::string value{reinterpret_cast<const char*>(prop)};
    xmlFree (prop);
    return value;
}

/* r:id is in the relationships namespace. */
static std::string
get_relationship_id (xmlNodePtr node)
{
    for (auto attr = node->properties; attr; attr = attr->next)
    {
        if (xmlStrcmp (attr->name, BAD_CAST "id") != 0 || !attr->ns)
            continue;
        auto value = xmlNodeGetContent (reinterpret_cast<xmlNodePtr>(attr));
        std::string id{value ? reinterpret_cast<const char*>(value) : ""};
        xmlFree (value);
        return id;
    }
    return {};
}

static std::string
node_text (xmlNodePtr node)
{
    auto content = xmlNodeGetContent (node);
    if (!content)
        return {};
    std::string text{reinterpret_cast<const char*>(content)};
    xmlFree (content);
    return text;
}

static xmlNodePtr
find_first (xmlNodePtr node, const char* name)
{
    for (; node; node = node->next)
    {
        if (is_element (node, name))
            return node;
        if (auto found = find_first (node->children, name))
            return found;
    }
    return nullptr;
}

/* The text of a shared string or inline string: its <t> runs, without the
 * phonetic ones. */
static std::string
rich_text (xmlNodePtr si)
{
    std::string text;
    for (auto child = si->children; child; child = child->next)
    {
        if (is_element (child, "t"))
            text += node_text (child);
        else if (is_element (child, "r"))
            text += rich_text (child);
    }
    return text;
}

static std::string
first_sheet_path (GsfInfile* zip, const std::string& filename)
{
    auto workbook = read_member (zip, "xl/workbook.xml");
    if (!workbook)
        throw CbImportFormatError (filename, "The file is not an xlsx workbook");
    auto doc = parse_part (*workbook, "xl/workbook.xml", filename);
    auto sheet = find_first (xmlDocGetRootElement (doc.get()), "sheet");
    if (!sheet)
        throw CbImportFormatError (filename, "The workbook has no worksheets");

    auto rid = get_relationship_id (sheet);
    PINFO ("first sheet '%s' (%s)", get_prop (sheet, "name").c_str(), rid.c_str());
    std::string fallback{"xl/worksheets/sheet1.xml"};
    auto rels = read_member (zip, "xl/_rels/workbook.xml.rels");
    if (rid.empty() || !rels)
        return fallback;

    auto rels_doc = parse_part (*rels, "xl/_rels/workbook.xml.rels", filename);
    for (auto rel = xmlDocGetRootElement (rels_doc.get())->children; rel;
         rel = rel->next)
    {
        if (!is_element (rel, "Relationship") || get_prop (rel, "Id") != rid)
            continue;
        auto target = get_prop (rel, "Target");
        if (target.empty())
            break;
        if (target.front() == '/')
            return target.substr (1);
        return "xl/" + target;
    }
    PWARN ("no relationship %s, trying %s", rid.c_str(), fallback.c_str());
    return fallback;
}

static StrVec
shared_strings (GsfInfile* zip, const std::string& filename)
{
    StrVec strings;
    auto part = read_member (zip, "xl/sharedStrings.xml");
    if (!part)
        return strings;
    auto doc = parse_part (*part, "xl/sharedStrings.xml", filename);
    for (auto si = xmlDocGetRootElement (doc.get())->children; si; si = si->next)
        if (is_element (si, "si"))
            strings.push_back (rich_text (si));
    return strings;
}

/* "AB12" -> 27; -1 without a column. */
static int
column_index (const std::string& ref)
{
    int col = 0;
    std::size_t i = 0;
    for (; i < ref.size() && g_ascii_isalpha (ref[i]); ++i)
        col = col * 26 + (g_ascii_toupper (ref[i]) - 'A' + 1);
    return i ? col - 1 : -1;
}

static std::string
cell_value (xmlNodePtr c, const StrVec& strings)
{
    auto type = get_prop (c, "t");
    if (type == "inlineStr")
    {
        auto is = find_first (c->children, "is");
        return is ? rich_text (is) : std::string{};
    }

    auto v = find_first (c->children, "v");
    if (!v)
        return {};
    auto value = node_text (v);
    if (type == "s")
    {
        gchar* end = nullptr;
        auto index = g_ascii_strtoull (value.c_str(), &end, 10);
        if (value.empty() || *end || index >= strings.size())
        {
            PWARN ("bad shared string index '%s'", value.c_str());
            return {};
        }
        return strings[index];
    }
    if (type == "b")
        return value == "1" ? "TRUE" : "FALSE";
    return value;
}

static std::vector<StrVec>
sheet_rows (const std::string& sheet, const StrVec& strings,
            const std::string& filename)
{
    auto doc = parse_part (sheet, "worksheet", filename);
    auto data = find_first (xmlDocGetRootElement (doc.get()), "sheetData");
    std::vector<StrVec> rows;
    if (!data)
        return rows;

    for (auto row = data->children; row; row = row->next)
    {
        if (!is_element (row, "row"))
            continue;
        StrVec cells;
        for (auto c = row->children; c; c = c->next)
        {
            if (!is_element (c, "c"))
                continue;
            auto col = column_index (get_prop (c, "r"));
            if (col < 0)
                col = cells.size();
            if (static_cast<std::size_t>(col) >= cells.size())
                cells.resize (col + 1);
            cells[col] = cell_value (c, strings);
        }
        if (std::all_of (cells.begin(), cells.end(),
                         [](const std::string& s) { return s.empty(); }))
            continue;
        rows.push_back (std::move (cells));
    }
    return rows;
}

static std::string
csv_quote (const std::string& cell)
{
    if (cell.find_first_of (",\"\r\n") == std::string::npos)
        return cell;
    return "\"" + boost::replace_all_copy (cell, "\"", "\"\"") + "\"";
}

std::string
cb_xlsx_first_sheet_to_csv (const std::string& contents,
                            const std::string& filename)
{
    static const std::string ole2_magic{"\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8};

    ENTER ("%s, %zu bytes", filename.c_str(), contents.size());
    if (contents.compare (0, ole2_magic.size(), ole2_magic) == 0)
    {
        PERR ("%s is a binary workbook", filename.c_str());
        throw CbImportFormatError (filename, "Binary .xls workbooks can't be "
                                   "read, save the sheet as .xlsx or .csv");
    }
    gsf_init_once ();

    GsfInputPtr input{gsf_input_memory_new (reinterpret_cast<const guint8*>(contents.data()),
                                            contents.size(), FALSE),
                      &g_object_unref};
    if (!input)
        throw CbImportFormatError (filename, "The workbook can't be read");

    GError* error = nullptr;
    GsfInfilePtr zip{gsf_infile_zip_new (input.get(), &error), &g_object_unref};
    if (!zip)
    {
        std::string msg{"The file is not an xlsx workbook"};
        if (error)
        {
            msg += std::string{": "} + error->message;
            g_error_free (error);
        }
        PERR ("%s", msg.c_str());
        throw CbImportFormatError (filename, msg);
    }

    auto path = first_sheet_path (zip.get(), filename);
    auto strings = shared_strings (zip.get(), filename);
    auto sheet = read_member (zip.get(), path);
    if (!sheet)
        throw CbImportFormatError (filename, "The workbook has no " + path);

    std::string csv;
    auto rows = sheet_rows (*sheet, strings, filename);
    for (const auto& row : rows)
    {
        StrVec quoted;
        for (const auto& cell : row)
            quoted.push_back (csv_quote (cell));
        csv += boost::join (quoted, ",") + "\n";
    }
    LEAVE ("%zu rows from %s", rows.size(), path.c_str());
    return csv;
}
