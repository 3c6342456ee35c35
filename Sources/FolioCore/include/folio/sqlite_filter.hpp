#pragma once

#include "types.hpp"
#include "sqlite_collection.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace folio {

enum class sort_order {
    ascending,
    descending
};

/// Predicate tree over one collection. Leaves address properties by
/// reader index (0 = id) and render to a parameterized SQL expression.
class filter {
public:
    enum class kind {
        condition,
        all_of,
        any_of,
        negation
    };

    enum class op {
        is_null,
        not_null,
        equal,
        greater,
        less,
        between,
        starts_with,
        ends_with,
        contains
    };

    static filter is_null(size_t property);
    static filter not_null(size_t property);
    static filter equal_to(size_t property, column_value_t value, bool case_sensitive = true);
    static filter greater_than(size_t property, column_value_t value, bool include = false,
                               bool case_sensitive = true);
    static filter less_than(size_t property, column_value_t value, bool include = false,
                            bool case_sensitive = true);
    static filter between(size_t property, column_value_t lower, column_value_t upper,
                          bool case_sensitive = true);
    static filter starts_with(size_t property, std::string prefix, bool case_sensitive = true);
    static filter ends_with(size_t property, std::string suffix, bool case_sensitive = true);
    static filter contains(size_t property, std::string needle, bool case_sensitive = true);

    static filter and_(std::vector<filter> filters);
    static filter or_(std::vector<filter> filters);
    static filter not_(filter f);

    [[nodiscard]] kind get_kind() const noexcept { return kind_; }

    /// Append this predicate to sql, pushing bound values onto params.
    /// Throws illegal_argument_error for property indexes the collection lacks.
    void to_sql(const sqlite_collection& collection, std::ostringstream& sql,
                std::vector<column_value_t>& params) const;

private:
    filter(kind k, op o, size_t property) : kind_(k), op_(o), property_(property) {}

    void condition_sql(const sqlite_collection& collection, std::ostringstream& sql,
                       std::vector<column_value_t>& params) const;

    kind kind_;
    op op_;
    size_t property_;
    column_value_t lower_ = nullptr;
    column_value_t upper_ = nullptr;
    bool include_ = false;
    bool case_sensitive_ = true;
    std::vector<filter> children_;
};

} // namespace folio
