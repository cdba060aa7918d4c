#include <tokwh/Cl_Tables.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/TWUtil.hh>

#include <algorithm>

using namespace tokwh;

Cl_Tables::~Cl_Tables() = default;

std::string
Cl_Tables::getName() const
{
    return "tables";
}

TWInterest
Cl_Tables::getInterest() const
{
    return {
        {"table_open",
         "table_close",
         "thead_open",
         "thead_close",
         "tr_open",
         "tr_close",
         "th_open",
         "th_close",
         "td_open",
         "td_close",
         "inline"},
        {}};
}

void
Cl_Tables::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "table_open") {
        if (!ctx.admitItem(tables.size())) {
            return;
        }
        Table t;
        t.start_line = wh.lineOf(index);
        t.section = cl::section_of(wh, t.start_line);
        tables.push_back(std::move(t));
        in_table = true;
        return;
    }
    if (!in_table || tables.empty()) {
        return;
    }
    auto& table = tables.back();
    if (type == "table_close") {
        in_table = in_head = in_row = in_cell = false;
    } else if (type == "thead_open") {
        in_head = true;
    } else if (type == "thead_close") {
        in_head = false;
    } else if (type == "tr_open") {
        if (in_head && table.rows.empty()) {
            table.header = true;
        }
        table.rows.emplace_back();
        in_row = true;
    } else if (type == "tr_close") {
        in_row = false;
    } else if (type == "th_open" || type == "td_open") {
        in_cell = true;
        cell.clear();
    } else if (type == "th_close" || type == "td_close") {
        if (in_cell && in_row) {
            table.rows.back().push_back(TWUtil::trim(cell));
        }
        in_cell = false;
    } else if (type == "inline" && in_cell) {
        cell += view.content();
    }
}

JSON
Cl_Tables::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& table: tables) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        size_t columns = 0;
        auto rows = j.addDictionaryMember("rows", JSON::makeArray());
        for (auto const& row: table.rows) {
            columns = std::max(columns, row.size());
            auto r = rows.addArrayElement(JSON::makeArray());
            for (auto const& c: row) {
                r.addArrayElement(JSON::makeString(c));
            }
        }
        j.addDictionaryMember("header", JSON::makeBool(table.header));
        j.addDictionaryMember("columns", cl::size_json(columns));
        j.addDictionaryMember("start_line", cl::line_json(table.start_line));
        j.addDictionaryMember("section", cl::section_json(table.section));
    }
    return result;
}

size_t
Cl_Tables::itemCount() const
{
    return tables.size();
}
