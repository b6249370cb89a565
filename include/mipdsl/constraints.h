#pragma once
/*
===============================================================================
CONSTRAINTS - Constraint records and the ordered constraint set
===============================================================================

OVERVIEW
--------
A Constraint is a compiled row `lhs sense rhs`. Its left-hand side is a
polynomial without constant term and its right-hand side is a plain number.
Constraints are immutable once added. The ConstraintSet keeps them in
insertion order, indexes them by id, and remembers which declaration
produced which contiguous block of rows.

KEY COMPONENTS
--------------
- Sense               - LessEqual, GreaterEqual, Equal
- Constraint          - id, name, lhs, sense, rhs
- ConstraintGroup     - one declaration's block of rows
- ConstraintSet       - ordered storage with id lookup
- Row helpers         - senseSymbol, activity, slack, violation

USAGE EXAMPLES
--------------
    ConstraintSet rows;
    rows.beginGroup("Supply {s}");
    rows.add(Constraint{"c00000000", "Supply S1", lhs, Sense::LessEqual, 20.0});
    rows.endGroup();

    const Constraint* c = rows.find("c00000000");
    double s = slack(*c, values);           // rhs - lhs(values) for <=

DEPENDENCIES
------------
- polynomial.h - Row storage
- expression.h - CompareOp for sense conversion
- enum_utils.h - Sense names

THREAD SAFETY
-------------
- Value types; concurrent const access is safe

EXCEPTION SAFETY
----------------
- add() offers the strong guarantee
- at() throws std::out_of_range for an unknown id

===============================================================================
*/

#include "enum_utils.h"
#include "expression.h"
#include "polynomial.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mipdsl {

    MIPDSL_DECLARE_ENUM_WITH_NAMES(Sense, LessEqual, GreaterEqual, Equal);

    /// @brief "<=", ">=" or "="
    inline std::string_view senseSymbol(Sense s) noexcept
    {
        switch (s) {
            case Sense::LessEqual: return "<=";
            case Sense::GreaterEqual: return ">=";
            case Sense::Equal: return "=";
            default: return "?";
        }
    }

    /**
     * @brief Constraint sense of a comparison operator
     * @return nullopt for strict and not-equal comparisons
     */
    inline std::optional<Sense> senseOf(CompareOp op) noexcept
    {
        switch (op) {
            case CompareOp::LessEqual: return Sense::LessEqual;
            case CompareOp::GreaterEqual: return Sense::GreaterEqual;
            case CompareOp::Equal: return Sense::Equal;
            default: return std::nullopt;
        }
    }

    /**
     * @struct Constraint
     * @brief One compiled row
     */
    struct Constraint {
        std::string id;
        std::string name;
        Polynomial lhs;
        Sense sense = Sense::LessEqual;
        double rhs = 0.0;

        std::string toString() const
        {
            return std::format("{}: {} {} {}", name, lhs.toString(), senseSymbol(sense),
                               Scalar::render_real(rhs));
        }
    };

    /**
     * @struct ConstraintGroup
     * @brief Contiguous rows produced by one declaration
     */
    struct ConstraintGroup {
        std::string label;
        std::size_t first = 0;
        std::size_t count = 0;
    };

    /**
     * @class ConstraintSet
     * @brief Ordered, id-indexed constraint storage
     */
    class ConstraintSet {
    public:
        ConstraintSet() = default;

        /// @brief Open a new group; rows added until endGroup() belong to it
        void beginGroup(std::string label)
        {
            groups_.push_back(ConstraintGroup{std::move(label), rows_.size(), 0});
        }

        void endGroup() noexcept
        {
            if (!groups_.empty())
                groups_.back().count = rows_.size() - groups_.back().first;
        }

        /**
         * @brief Append a row
         * @throws std::invalid_argument for a duplicate id
         */
        const Constraint& add(Constraint row)
        {
            if (byId_.contains(row.id))
                throw std::invalid_argument(std::format("ConstraintSet::add: duplicate id '{}'", row.id));
            byId_.emplace(row.id, rows_.size());
            rows_.push_back(std::move(row));
            return rows_.back();
        }

        [[nodiscard]] const Constraint* find(std::string_view id) const
        {
            auto it = byId_.find(id);
            return it == byId_.end() ? nullptr : &rows_[it->second];
        }

        [[nodiscard]] const Constraint& at(std::string_view id) const
        {
            const Constraint* c = find(id);
            if (!c)
                throw std::out_of_range(std::format("ConstraintSet::at: no constraint '{}'", id));
            return *c;
        }

        /// @brief All rows whose name equals `name`, in order
        [[nodiscard]] std::vector<const Constraint*> named(std::string_view name) const
        {
            std::vector<const Constraint*> out;
            for (const auto& r : rows_) {
                if (r.name == name)
                    out.push_back(&r);
            }
            return out;
        }

        [[nodiscard]] const std::vector<Constraint>& rows() const noexcept { return rows_; }
        [[nodiscard]] const std::vector<ConstraintGroup>& groups() const noexcept { return groups_; }
        [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
        [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

        const Constraint& operator[](std::size_t i) const { return rows_.at(i); }

        /// Row and group counts at one point in time
        struct Checkpoint {
            std::size_t rows = 0;
            std::size_t groups = 0;
        };

        [[nodiscard]] Checkpoint checkpoint() const noexcept { return {rows_.size(), groups_.size()}; }

        /// @brief Drop rows and groups added since a checkpoint
        void rollback(const Checkpoint& cp)
        {
            while (rows_.size() > cp.rows) {
                byId_.erase(rows_.back().id);
                rows_.pop_back();
            }
            groups_.resize(cp.groups);
        }

        auto begin() const noexcept { return rows_.begin(); }
        auto end() const noexcept { return rows_.end(); }

    private:
        std::vector<Constraint> rows_;
        std::map<std::string, std::size_t, std::less<>> byId_;
        std::vector<ConstraintGroup> groups_;
    };

    // ========================================================================
    // ROW HELPERS
    // ========================================================================

    /// @brief Left-hand side value under an assignment
    template<typename Assignment>
    double activity(const Constraint& c, const Assignment& values)
    {
        return c.lhs.evaluate(values);
    }

    /**
     * @brief Signed slack: positive when the row holds with room to spare
     * @details For equality rows, minus the absolute residual.
     */
    template<typename Assignment>
    double slack(const Constraint& c, const Assignment& values)
    {
        double lhs = activity(c, values);
        switch (c.sense) {
            case Sense::LessEqual: return c.rhs - lhs;
            case Sense::GreaterEqual: return lhs - c.rhs;
            default: return -std::fabs(lhs - c.rhs);
        }
    }

    /// @brief Amount by which a row is violated, 0 when satisfied
    template<typename Assignment>
    double violation(const Constraint& c, const Assignment& values)
    {
        return std::max(0.0, -slack(c, values));
    }

} // namespace mipdsl
