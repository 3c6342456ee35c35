#include "folio/sqlite_filter.hpp"

namespace folio {

filter filter::is_null(size_t property) {
    return filter(kind::condition, op::is_null, property);
}

filter filter::not_null(size_t property) {
    return filter(kind::condition, op::not_null, property);
}

filter filter::equal_to(size_t property, column_value_t value, bool case_sensitive) {
    filter f(kind::condition, op::equal, property);
    f.lower_ = std::move(value);
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::greater_than(size_t property, column_value_t value, bool include, bool case_sensitive) {
    filter f(kind::condition, op::greater, property);
    f.lower_ = std::move(value);
    f.include_ = include;
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::less_than(size_t property, column_value_t value, bool include, bool case_sensitive) {
    filter f(kind::condition, op::less, property);
    f.upper_ = std::move(value);
    f.include_ = include;
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::between(size_t property, column_value_t lower, column_value_t upper, bool case_sensitive) {
    filter f(kind::condition, op::between, property);
    f.lower_ = std::move(lower);
    f.upper_ = std::move(upper);
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::starts_with(size_t property, std::string prefix, bool case_sensitive) {
    filter f(kind::condition, op::starts_with, property);
    f.lower_ = std::move(prefix);
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::ends_with(size_t property, std::string suffix, bool case_sensitive) {
    filter f(kind::condition, op::ends_with, property);
    f.lower_ = std::move(suffix);
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::contains(size_t property, std::string needle, bool case_sensitive) {
    filter f(kind::condition, op::contains, property);
    f.lower_ = std::move(needle);
    f.case_sensitive_ = case_sensitive;
    return f;
}

filter filter::and_(std::vector<filter> filters) {
    filter f(kind::all_of, op::equal, 0);
    f.children_ = std::move(filters);
    return f;
}

filter filter::or_(std::vector<filter> filters) {
    filter f(kind::any_of, op::equal, 0);
    f.children_ = std::move(filters);
    return f;
}

filter filter::not_(filter inner) {
    filter f(kind::negation, op::equal, 0);
    f.children_.push_back(std::move(inner));
    return f;
}

void filter::to_sql(const sqlite_collection& collection, std::ostringstream& sql,
                    std::vector<column_value_t>& params) const {
    switch (kind_) {
        case kind::condition:
            condition_sql(collection, sql, params);
            break;
        case kind::all_of:
        case kind::any_of: {
            if (children_.empty()) {
                // Empty AND matches everything, empty OR nothing
                sql << (kind_ == kind::all_of ? "1" : "0");
                break;
            }
            const char* joiner = kind_ == kind::all_of ? " AND " : " OR ";
            sql << "(";
            for (size_t i = 0; i < children_.size(); ++i) {
                if (i > 0) sql << joiner;
                children_[i].to_sql(collection, sql, params);
            }
            sql << ")";
            break;
        }
        case kind::negation:
            sql << "NOT (";
            children_.front().to_sql(collection, sql, params);
            sql << ")";
            break;
    }
}

void filter::condition_sql(const sqlite_collection& collection, std::ostringstream& sql,
                           std::vector<column_value_t>& params) const {
    const auto column = collection.column(property_);
    const char* collate = case_sensitive_ ? "" : " COLLATE NOCASE";

    switch (op_) {
        case op::is_null:
            sql << column << " IS NULL";
            break;
        case op::not_null:
            sql << column << " IS NOT NULL";
            break;
        case op::equal:
            if (std::holds_alternative<std::nullptr_t>(lower_)) {
                sql << column << " IS NULL";
            } else {
                sql << column << " = ?" << collate;
                params.push_back(lower_);
            }
            break;
        case op::greater:
            sql << column << (include_ ? " >= ?" : " > ?") << collate;
            params.push_back(lower_);
            break;
        case op::less:
            sql << column << (include_ ? " <= ?" : " < ?") << collate;
            params.push_back(upper_);
            break;
        case op::between:
            sql << "(" << column << " >= ?" << collate << " AND " << column << " <= ?" << collate << ")";
            params.push_back(lower_);
            params.push_back(upper_);
            break;
        case op::starts_with:
            if (case_sensitive_) {
                sql << "substr(" << column << ", 1, length(?)) = ?";
            } else {
                sql << "lower(substr(" << column << ", 1, length(?))) = lower(?)";
            }
            params.push_back(lower_);
            params.push_back(lower_);
            break;
        case op::ends_with: {
            const auto& suffix = std::get<std::string>(lower_);
            if (suffix.empty()) {
                sql << column << " IS NOT NULL";
            } else if (case_sensitive_) {
                sql << "substr(" << column << ", -length(?)) = ?";
                params.push_back(lower_);
                params.push_back(lower_);
            } else {
                sql << "lower(substr(" << column << ", -length(?))) = lower(?)";
                params.push_back(lower_);
                params.push_back(lower_);
            }
            break;
        }
        case op::contains:
            if (case_sensitive_) {
                sql << "instr(" << column << ", ?) > 0";
            } else {
                sql << "instr(lower(" << column << "), lower(?)) > 0";
            }
            params.push_back(lower_);
            break;
    }
}

} // namespace folio
