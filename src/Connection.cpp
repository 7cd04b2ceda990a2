#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace oraenhanced {

namespace {
const SqlValue kNull;
}

Row::Row(std::initializer_list<std::pair<std::string, SqlValue>> fields)
    : m_fields(fields) {
}

void Row::add(std::string name, SqlValue value) {
    m_fields.emplace_back(std::move(name), std::move(value));
}

const SqlValue& Row::operator[](const std::string& name) const {
    for (const auto& field : m_fields) {
        if (field.first == name) {
            return field.second;
        }
    }
    return kNull;
}

std::string Row::str(const std::string& name) const {
    return (*this)[name].value_or("");
}

bool Row::has(const std::string& name) const {
    for (const auto& field : m_fields) {
        if (field.first == name) {
            return true;
        }
    }
    return false;
}

std::optional<Row> Connection::selectOne(const std::string& sql, const std::string& label,
                                         const Binds& binds) {
    Rows rows = selectAll(sql, label, binds);
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

SqlValue Connection::selectValue(const std::string& sql, const std::string& label,
                                 const Binds& binds) {
    auto row = selectOne(sql, label, binds);
    if (!row || row->empty()) {
        return std::nullopt;
    }
    return row->at(0);
}

std::vector<std::string> Connection::selectValues(const std::string& sql, const std::string& label,
                                                  const Binds& binds) {
    std::vector<std::string> values;
    for (const auto& row : selectAll(sql, label, binds)) {
        if (!row.empty() && row.at(0)) {
            values.push_back(*row.at(0));
        }
    }
    return values;
}

std::vector<int> Connection::databaseVersion() {
    auto version = selectValue(
        "SELECT version FROM product_component_version WHERE product LIKE 'Oracle Database%'",
        "VERSION");
    if (!version) {
        throw DatabaseError("Could not determine the database version");
    }

    std::vector<int> parts;
    std::istringstream stream(*version);
    std::string part;
    while (std::getline(stream, part, '.')) {
        try {
            parts.push_back(std::stoi(part));
        } catch (const std::logic_error&) {
            throw DatabaseError("Unparseable database version: " + *version);
        }
    }
    return parts;
}

bool Connection::active() {
    try {
        ping();
        return true;
    } catch (const ConnectionException&) {
        return false;
    }
}

void Connection::reconnect() {
    try {
        reset();
    } catch (const ConnectionException& e) {
        spdlog::warn("{} automatic reconnection failed: {}", adapterName(), e.what());
    }
}

}  // namespace oraenhanced
