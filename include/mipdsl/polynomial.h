#pragma once
/*
===============================================================================
POLYNOMIAL — Canonical polynomials over variable instances
===============================================================================

OVERVIEW
--------
A Polynomial maps monomials to coefficients. A monomial is a sorted multiset
of canonical variable names stored as a sorted vector; the empty monomial is
the constant term. Coefficients of equal monomials are summed and zero
coefficients are pruned after every operation, so two polynomials describing
the same expression compare equal and print identically.

The compiler only ever produces degree <= 1 polynomials. The representation
itself does not forbid higher degrees; linearity is enforced where products
are formed.

KEY COMPONENTS
--------------
• Monomial: std::vector<std::string>, kept sorted
• Polynomial: std::map<Monomial, double> with arithmetic operators
• Queries: constantTerm, hasVariables, coefficient, variables, degree
• evaluate: value under a variable assignment

USAGE EXAMPLES
--------------
    Polynomial p = Polynomial::variable("x(1)") * 2.0 + Polynomial::constant(5);
    p -= Polynomial::variable("y");
    p.toString();            // "2 x(1) - y + 5"
    p.constantTerm();        // 5.0
    p.withoutConstant();     // 2 x(1) - y

PERFORMANCE NOTES
-----------------
• Addition is O(n log n) in the number of terms; scaling is O(n)
• std::map keeps terms ordered, which is what makes output deterministic

THREAD SAFETY
-------------
• Value type; no shared state

EXCEPTION SAFETY
----------------
• Strong guarantee for all operations
• evaluate throws std::out_of_range for a variable missing from the assignment

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mipdsl {

using Monomial = std::vector<std::string>;

/**
 * @class Polynomial
 * @brief Coefficient-per-monomial representation
 */
class Polynomial {
public:
    using Terms = std::map<Monomial, double>;

    Polynomial() = default;

    static Polynomial constant(double value)
    {
        Polynomial p;
        if (value != 0.0)
            p.terms_[Monomial{}] = value;
        return p;
    }

    static Polynomial variable(std::string name, double coefficient = 1.0)
    {
        Polynomial p;
        if (coefficient != 0.0)
            p.terms_[Monomial{std::move(name)}] = coefficient;
        return p;
    }

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    const Terms& terms() const noexcept { return terms_; }
    std::size_t size() const noexcept { return terms_.size(); }
    bool isZero() const noexcept { return terms_.empty(); }

    /// @brief True if any monomial of positive degree is present
    bool hasVariables() const noexcept
    {
        return std::any_of(terms_.begin(), terms_.end(),
                           [](const auto& t) { return !t.first.empty(); });
    }

    bool isConstant() const noexcept { return !hasVariables(); }

    double constantTerm() const noexcept
    {
        auto it = terms_.find(Monomial{});
        return it == terms_.end() ? 0.0 : it->second;
    }

    Polynomial withoutConstant() const
    {
        Polynomial p = *this;
        p.terms_.erase(Monomial{});
        return p;
    }

    /// @brief Coefficient of a single variable (degree-1 monomial)
    double coefficient(const std::string& name) const
    {
        auto it = terms_.find(Monomial{name});
        return it == terms_.end() ? 0.0 : it->second;
    }

    std::size_t degree() const noexcept
    {
        std::size_t d = 0;
        for (const auto& [m, _] : terms_)
            d = std::max(d, m.size());
        return d;
    }

    /// @brief Distinct variable names, sorted
    std::set<std::string> variables() const
    {
        std::set<std::string> out;
        for (const auto& [m, _] : terms_)
            out.insert(m.begin(), m.end());
        return out;
    }

    /**
     * @brief Value of the polynomial under an assignment
     * @throws std::out_of_range if a variable has no value
     */
    template<typename Assignment>
    double evaluate(const Assignment& values) const
    {
        double total = 0.0;
        for (const auto& [m, c] : terms_) {
            double term = c;
            for (const auto& name : m) {
                auto it = values.find(name);
                if (it == values.end())
                    throw std::out_of_range(std::format("no value for variable '{}'", name));
                term *= it->second;
            }
            total += term;
        }
        return total;
    }

    // ------------------------------------------------------------------------
    // Arithmetic
    // ------------------------------------------------------------------------

    Polynomial& operator+=(const Polynomial& other)
    {
        for (const auto& [m, c] : other.terms_)
            accumulate(m, c);
        return *this;
    }

    Polynomial& operator-=(const Polynomial& other)
    {
        for (const auto& [m, c] : other.terms_)
            accumulate(m, -c);
        return *this;
    }

    Polynomial& operator*=(double factor)
    {
        if (factor == 0.0) {
            terms_.clear();
            return *this;
        }
        for (auto it = terms_.begin(); it != terms_.end();) {
            it->second *= factor;
            if (it->second == 0.0)
                it = terms_.erase(it);
            else
                ++it;
        }
        return *this;
    }

    /// Divides each coefficient directly so constants match scalar division
    Polynomial& operator/=(double divisor)
    {
        for (auto it = terms_.begin(); it != terms_.end();) {
            it->second /= divisor;
            if (it->second == 0.0)
                it = terms_.erase(it);
            else
                ++it;
        }
        return *this;
    }

    Polynomial operator-() const
    {
        Polynomial p = *this;
        for (auto& [_, c] : p.terms_)
            c = -c;
        return p;
    }

    friend Polynomial operator+(Polynomial a, const Polynomial& b) { return a += b; }
    friend Polynomial operator-(Polynomial a, const Polynomial& b) { return a -= b; }
    friend Polynomial operator*(Polynomial a, double k) { return a *= k; }
    friend Polynomial operator*(double k, Polynomial a) { return a *= k; }
    friend Polynomial operator/(Polynomial a, double k) { return a /= k; }

    friend bool operator==(const Polynomial& a, const Polynomial& b) { return a.terms_ == b.terms_; }

    // ------------------------------------------------------------------------
    // Rendering
    // ------------------------------------------------------------------------

    /**
     * @brief Text form: variable terms in monomial order, constant last
     * @example "2 x(1) - y(a) + 5", "0" for the zero polynomial
     */
    std::string toString() const
    {
        if (terms_.empty())
            return "0";

        std::string out;
        auto emit = [&](const Monomial& m, double c) {
            const bool first = out.empty();
            if (c < 0)
                out += first ? "-" : " - ";
            else if (!first)
                out += " + ";
            double mag = std::fabs(c);
            if (m.empty()) {
                out += std::format("{}", mag);
                return;
            }
            if (mag != 1.0)
                out += std::format("{} ", mag);
            for (std::size_t i = 0; i < m.size(); ++i) {
                if (i > 0)
                    out += " * ";
                out += m[i];
            }
        };

        for (const auto& [m, c] : terms_) {
            if (!m.empty())
                emit(m, c);
        }
        if (auto it = terms_.find(Monomial{}); it != terms_.end())
            emit(it->first, it->second);
        return out;
    }

private:
    void accumulate(const Monomial& m, double c)
    {
        if (c == 0.0)
            return;
        auto [it, inserted] = terms_.try_emplace(m, c);
        if (!inserted) {
            it->second += c;
            if (it->second == 0.0)
                terms_.erase(it);
        }
    }

    Terms terms_;
};

} // namespace mipdsl
