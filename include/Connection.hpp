#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <cstdint>
#include <initializer_list>

namespace oraenhanced {

// Name reported by the Oracle transport
inline constexpr const char* kOracleAdapterName = "OracleEnhanced";

using SqlValue = std::optional<std::string>;

// Positional bind parameter. The name only labels the value in logs.
struct Bind {
    std::string name;
    SqlValue value;
};

using Binds = std::vector<Bind>;

inline Bind bindString(const std::string& name, const std::string& value) {
    return Bind{name, value};
}

// One fetched row; field names are lowercase, in select-list order
class Row {
public:
    Row() = default;
    Row(std::initializer_list<std::pair<std::string, SqlValue>> fields);

    void add(std::string name, SqlValue value);

    // Null when the field is NULL or absent
    const SqlValue& operator[](const std::string& name) const;

    // Empty string when the field is NULL or absent
    std::string str(const std::string& name) const;

    bool has(const std::string& name) const;
    bool empty() const { return m_fields.empty(); }
    size_t size() const { return m_fields.size(); }
    const SqlValue& at(size_t index) const { return m_fields.at(index).second; }
    const std::vector<std::pair<std::string, SqlValue>>& fields() const { return m_fields; }

private:
    std::vector<std::pair<std::string, SqlValue>> m_fields;
};

using Rows = std::vector<Row>;

// Writable handle on a LOB locator selected FOR UPDATE
class LobHandle {
public:
    virtual ~LobHandle() = default;

    // Replace the LOB contents with data
    virtual void write(const std::string& data, bool binary) = 0;
};

// Abstract blocking transport. Statements run on one session; failures
// surface as the exceptions declared in ErrorHandler.hpp.
class Connection {
public:
    virtual ~Connection() = default;

    virtual Rows selectAll(const std::string& sql, const std::string& label = "SQL",
                           const Binds& binds = {}) = 0;

    // Returns the number of affected rows
    virtual uint64_t execute(const std::string& sql, const std::string& label = "SQL",
                             const Binds& binds = {}) = 0;

    // Runs a single-column SELECT ... FOR UPDATE; null when no row matched
    virtual std::unique_ptr<LobHandle> selectLobForUpdate(const std::string& sql,
                                                          const std::string& label = "SQL",
                                                          const Binds& binds = {}) = 0;

    // Throws ConnectionException when the session is gone
    virtual void ping() = 0;

    // Re-establish the session
    virtual void reset() = 0;

    virtual std::string adapterName() const = 0;

    std::optional<Row> selectOne(const std::string& sql, const std::string& label = "SQL",
                                 const Binds& binds = {});

    // First column of the first row
    SqlValue selectValue(const std::string& sql, const std::string& label = "SQL",
                         const Binds& binds = {});

    // First column of every row, NULLs skipped
    std::vector<std::string> selectValues(const std::string& sql, const std::string& label = "SQL",
                                          const Binds& binds = {});

    // Server version components, e.g. {19, 0, 0, 0, 0}
    std::vector<int> databaseVersion();

    bool active();

    // reset() that logs instead of throwing when the database stays unreachable
    void reconnect();

protected:
    Connection() = default;
};

}  // namespace oraenhanced
