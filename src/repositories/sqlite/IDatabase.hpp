#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace esc::repositories::sqlite {

using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;
using SqlParams = std::vector<SqlValue>;
using SqlRow = std::map<std::string, SqlValue>;

// The only surface the relational backend needs from a storage engine.
class IDatabase {
public:
    virtual void execute(const std::string& statement, const SqlParams& params = {}) = 0;
    virtual std::vector<SqlRow> query(const std::string& statement,
                                      const SqlParams& params = {}) const = 0;
    virtual void close() = 0;
    virtual bool is_open() const noexcept = 0;
    virtual ~IDatabase() = default;
};

} // namespace esc::repositories::sqlite
