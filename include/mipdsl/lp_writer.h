#pragma once
/*
===============================================================================
LP WRITER — CPLEX LP export of a Problem
===============================================================================

OVERVIEW
--------
Writes a compiled Problem in CPLEX LP format, readable by Gurobi, CPLEX,
HiGHS, CBC and GLPK:

    \ Problem: transport
    Minimize
     obj: 4 ship(S1,C1) + 6 ship(S1,C2) + 5 ship(S2,C1) + 3 ship(S2,C2)
    Subject To
     c00000000: ship(S1,C1) + ship(S1,C2) <= 20
     ...
    Bounds
     ship(S1,C1) >= 0
     ...
    End

Names that LP readers would reject (too long, leading digit/period/e/E,
characters such as '-' or '+', a leading underscore that could clash with
an alias, or a repeated row name) are written under aliases `_v<id>` for
variables and `_c<k>` for rows. A comment legend at the top maps every
alias back to its canonical name.

KEY COMPONENTS
--------------
• writeLp(problem, os): stream the model
• toLpString(problem): same, into a string
• LP_INFINITY: the value written for infinite bounds and coefficients

FORMAT NOTES
------------
• Objective and constraint rows are wrapped before LP_LINE_WIDTH columns
• Every non-binary variable gets a Bounds line, since an absent bound
  means unbounded here while LP readers default the lower bound to 0
• A row without variable terms is written with a bare 0 left-hand side
• Binary variables go to `Binary`, integers to `General`
• A missing objective is written as an empty `Minimize` row

EXCEPTION SAFETY
----------------
• Stream errors are left to the stream's exception mask

===============================================================================
*/

#include "constraints.h"
#include "naming.h"
#include "polynomial.h"
#include "problem.h"
#include "variables.h"

#include <cmath>
#include <cstddef>
#include <format>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace mipdsl {

inline constexpr double LP_INFINITY = 1e+30;
inline constexpr std::size_t LP_LINE_WIDTH = 78;

namespace lp_detail {

    inline std::string number(double v)
    {
        if (std::isinf(v))
            v = v > 0 ? LP_INFINITY : -LP_INFINITY;
        return std::format("{}", v);
    }

    /// Name table for one export
    class LpNames {
    public:
        explicit LpNames(const Problem& problem)
        {
            for (const auto& v : problem.registry().instances()) {
                std::string out = usable(v.name) ? v.name : std::format("_v{}", v.id);
                if (out != v.name)
                    legend_.emplace_back(out, v.name);
                vars_.emplace(v.name, std::move(out));
            }

            std::set<std::string> taken;
            const auto& rows = problem.constraintSet().rows();
            for (std::size_t k = 0; k < rows.size(); ++k) {
                const std::string& name = rows[k].name;
                std::string out = usable(name) && !taken.contains(name) ? name : std::format("_c{}", k);
                if (out != name)
                    legend_.emplace_back(out, name);
                taken.insert(out);
                rows_.push_back(std::move(out));
            }
        }

        const std::string& variable(const std::string& canonical) const { return vars_.at(canonical); }
        const std::string& row(std::size_t k) const { return rows_.at(k); }
        const std::vector<std::pair<std::string, std::string>>& legend() const noexcept { return legend_; }

    private:
        static bool usable(const std::string& name)
        {
            return isLpName(name) && name.front() != '_' && name != "obj";
        }

        std::unordered_map<std::string, std::string> vars_;
        std::vector<std::string> rows_;
        std::vector<std::pair<std::string, std::string>> legend_;
    };

    /// Accumulates one row, breaking lines before LP_LINE_WIDTH
    class RowWriter {
    public:
        RowWriter(std::ostream& os, std::string head) : os_(os), column_(head.size())
        {
            os_ << head;
        }

        void token(const std::string& text)
        {
            if (column_ + 1 + text.size() > LP_LINE_WIDTH && column_ > 1) {
                os_ << "\n  ";
                column_ = 2;
            } else {
                os_ << ' ';
                ++column_;
            }
            os_ << text;
            column_ += text.size();
        }

        void terms(const Polynomial& p, const LpNames& names, bool withConstant)
        {
            bool first = true;
            double constant = 0.0;
            for (const auto& [monomial, coef] : p.terms()) {
                if (monomial.empty()) {
                    constant = coef;
                    continue;
                }
                term(coef, names.variable(monomial.front()), first);
                first = false;
            }
            if (withConstant && constant != 0.0) {
                token(first ? number(constant) : (constant < 0 ? "- " : "+ ") + number(std::fabs(constant)));
                first = false;
            }
            if (first && !withConstant)
                token("0");
        }

        void end() { os_ << '\n'; }

    private:
        void term(double coef, const std::string& name, bool first)
        {
            std::string sign;
            if (coef < 0)
                sign = "- ";
            else if (!first)
                sign = "+ ";
            double mag = std::fabs(coef);
            token(mag == 1.0 ? sign + name : sign + number(mag) + " " + name);
        }

        std::ostream& os_;
        std::size_t column_;
    };

} // namespace lp_detail

/**
 * @brief Write `problem` in CPLEX LP format
 *
 * @example
 *     std::ofstream file("transport.lp");
 *     writeLp(problem, file);
 */
inline void writeLp(const Problem& problem, std::ostream& os)
{
    lp_detail::LpNames names(problem);

    os << "\\ Problem: " << problem.name() << '\n';
    if (!names.legend().empty()) {
        os << "\\ Aliases:\n";
        for (const auto& [alias, original] : names.legend())
            os << "\\   " << alias << " = " << original << '\n';
    }

    os << (problem.effectiveDirection() == Direction::Maximize ? "Maximize\n" : "Minimize\n");
    {
        lp_detail::RowWriter row(os, " obj:");
        Polynomial objective = problem.objective() ? problem.objective()->polynomial : Polynomial{};
        row.terms(objective, names, true);
        row.end();
    }

    os << "Subject To\n";
    const auto& rows = problem.constraintSet().rows();
    for (std::size_t k = 0; k < rows.size(); ++k) {
        const Constraint& c = rows[k];
        lp_detail::RowWriter row(os, " " + names.row(k) + ":");
        row.terms(c.lhs, names, false);
        row.token(std::string(senseSymbol(c.sense)));
        row.token(lp_detail::number(c.rhs));
        row.end();
    }

    std::vector<std::string> bounds, general, binary;
    for (const auto& v : problem.registry().instances()) {
        const std::string& name = names.variable(v.name);
        if (v.type == VarType::Binary) {
            binary.push_back(name);
            continue;
        }
        if (v.type == VarType::Integer)
            general.push_back(name);

        double lo = v.lowerBound(), hi = v.upperBound();
        if (std::isinf(lo) && std::isinf(hi))
            bounds.push_back(std::format(" {} free", name));
        else if (std::isinf(lo))
            bounds.push_back(std::format(" -inf <= {} <= {}", name, lp_detail::number(hi)));
        else if (std::isinf(hi))
            bounds.push_back(std::format(" {} >= {}", name, lp_detail::number(lo)));
        else if (lo == hi)
            bounds.push_back(std::format(" {} = {}", name, lp_detail::number(lo)));
        else
            bounds.push_back(std::format(" {} <= {} <= {}", lp_detail::number(lo), name, lp_detail::number(hi)));
    }

    auto section = [&os](const char* title, const std::vector<std::string>& lines, bool indent) {
        if (lines.empty())
            return;
        os << title << '\n';
        for (const auto& l : lines)
            os << (indent ? " " : "") << l << '\n';
    };
    section("Bounds", bounds, false);
    section("General", general, true);
    section("Binary", binary, true);
    os << "End\n";
}

/// @brief LP text of `problem`
inline std::string toLpString(const Problem& problem)
{
    std::ostringstream os;
    writeLp(problem, os);
    return os.str();
}

} // namespace mipdsl
