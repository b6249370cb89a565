#pragma once
/*
===============================================================================
VARIABLES — Variable families, instances and the registry
===============================================================================

OVERVIEW
--------
The VariableRegistry owns every decision variable of a problem. A family
(`ship`, `x`, `open`) fixes the type, bound template, description and index
arity. An instance is one concrete `(family, index tuple)` with a dense id
and a canonical name. Instantiation is idempotent: asking for the same key
twice returns the same instance.

The registry also records, per family and index position, which values
each `variables` declaration ranged over and which values compiled
expressions introduced later. Wildcard sums (`sum(x(i, _))`) read their
domain from these records.

KEY COMPONENTS
--------------
• VarType: Continuous, Integer, Binary
• Bounds: optional lower/upper; absent means unbounded
• VariableInstance: id, family, index, canonical name, type, bounds
• VariableFamily: type, bound template, arity, recorded position domains
• VariableRegistry: declareFamily, declareDomain, instantiate, find,
  wildcardDomain, checkpoint/rollback

DESIGN PHILOSOPHY
-----------------
• Instances live in one flat vector in registration order; ids are positions
• Families keep an index -> id map for O(log n) tuple lookup
• Bounds are never mutated in place; a conflicting redeclaration is an error

USAGE EXAMPLES
--------------
    VariableRegistry reg;
    reg.declareFamily("x", VarType::Integer, Bounds{0.0, 10.0}, "", 1);

    const auto& a = reg.instantiate("x", {Scalar(1)});
    const auto& b = reg.instantiate("x", {Scalar(1)});
    assert(a.id == b.id);                  // idempotent
    a.name;                                // "x(1)"

    reg.declareDomain("x", 0, {Scalar(1), Scalar(2), Scalar(3)});
    reg.wildcardDomain("x", 0);            // {1, 2, 3}

THREAD SAFETY
-------------
• Not thread-safe; a registry belongs to one Problem

EXCEPTION SAFETY
----------------
• DslError for every rule violation (DuplicateFamily, InvalidBounds,
  UndefinedVariable, ArityMismatch, UnresolvedWildcardDomain,
  InvalidDeclaration)
• Basic guarantee; checkpoint()/rollback() undo a failed declaration, which
  is how Problem gets atomicity

===============================================================================
*/

#include "enum_utils.h"
#include "errors.h"
#include "naming.h"
#include "parameters.h"

#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mipdsl {

    MIPDSL_DECLARE_ENUM_WITH_NAMES(VarType, Continuous, Integer, Binary);

    /// Infinity sentinel for bounds and right-hand sides
    inline constexpr double INF = std::numeric_limits<double>::infinity();

    using IndexTuple = std::vector<Scalar>;

    /// @brief Render an index tuple as "(a, b)" for messages
    inline std::string describeTuple(const IndexTuple& index)
    {
        std::string out = "(";
        for (std::size_t i = 0; i < index.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += index[i].to_string();
        }
        return out + ")";
    }

    // ========================================================================
    // BOUNDS
    // ========================================================================

    /**
     * @struct Bounds
     * @brief Optional lower/upper bound; an absent side is unbounded
     */
    struct Bounds {
        std::optional<double> lower;
        std::optional<double> upper;

        [[nodiscard]] bool empty() const noexcept { return !lower && !upper; }

        friend bool operator==(const Bounds&, const Bounds&) = default;
    };

    // ========================================================================
    // INSTANCES AND FAMILIES
    // ========================================================================

    /**
     * @struct VariableInstance
     * @brief One concrete variable
     */
    struct VariableInstance {
        std::size_t id = 0;
        std::string family;
        IndexTuple index;
        std::string name;
        VarType type = VarType::Continuous;
        Bounds bounds;
        std::string description;

        /// @brief Effective lower bound: 0 for binaries, -INF when absent
        [[nodiscard]] double lowerBound() const noexcept
        {
            if (type == VarType::Binary)
                return 0.0;
            return bounds.lower.value_or(-INF);
        }

        /// @brief Effective upper bound: 1 for binaries, +INF when absent
        [[nodiscard]] double upperBound() const noexcept
        {
            if (type == VarType::Binary)
                return 1.0;
            return bounds.upper.value_or(INF);
        }
    };

    /**
     * @class VariableFamily
     * @brief Declared family of variables sharing type and arity
     */
    class VariableFamily {
    public:
        VariableFamily(std::string name, VarType type, Bounds bounds,
                       std::string description, std::size_t arity)
            : name_(std::move(name))
            , type_(type)
            , bounds_(bounds)
            , description_(std::move(description))
            , positions_(arity)
        {
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] VarType type() const noexcept { return type_; }
        [[nodiscard]] const Bounds& bounds() const noexcept { return bounds_; }
        [[nodiscard]] const std::string& description() const noexcept { return description_; }
        [[nodiscard]] std::size_t arity() const noexcept { return positions_.size(); }
        [[nodiscard]] std::size_t size() const noexcept { return byIndex_.size(); }

        /// @brief Instance ids in registration order
        [[nodiscard]] const std::vector<std::size_t>& instanceIds() const noexcept { return ids_; }

        /// @brief Number of declarations that recorded a domain for a position
        [[nodiscard]] std::size_t declaredDomainCount(std::size_t position) const
        {
            return positions_.at(position).declared.size();
        }

    private:
        friend class VariableRegistry;

        struct PositionDomain {
            std::vector<std::vector<Scalar>> declared;
            std::vector<Scalar> observed;
            std::set<Scalar> observedSet;
        };

        std::string name_;
        VarType type_;
        Bounds bounds_;
        std::string description_;
        std::vector<PositionDomain> positions_;
        std::map<IndexTuple, std::size_t> byIndex_;
        std::vector<std::size_t> ids_;
    };

    // ========================================================================
    // REGISTRY
    // ========================================================================

    /**
     * @class VariableRegistry
     * @brief Canonical (family, index) -> instance mapping
     */
    class VariableRegistry {
    public:
        VariableRegistry() = default;

        /**
         * @brief Validate a bound pair against a variable type
         *
         * @throws DslError(InvalidBounds) if:
         *   - the type is binary and any bound is given
         *   - the type is integer and a finite bound has a fractional part
         *   - a bound is NaN or lower > upper
         */
        static void validateBounds(std::string_view family, VarType type, const Bounds& bounds)
        {
            if (type == VarType::Binary && !bounds.empty()) {
                throw DslError(ErrorKind::InvalidBounds, std::string(family),
                    std::format("binary variable '{}' cannot carry explicit bounds", family));
            }
            for (const auto& b : {bounds.lower, bounds.upper}) {
                if (!b)
                    continue;
                if (std::isnan(*b)) {
                    throw DslError(ErrorKind::InvalidBounds, std::string(family),
                        std::format("bound of '{}' is NaN", family));
                }
                if (type == VarType::Integer && std::isfinite(*b) && std::floor(*b) != *b) {
                    throw DslError(ErrorKind::InvalidBounds, std::string(family),
                        std::format("integer variable '{}' has non-integral bound {}", family, *b));
                }
            }
            if (bounds.lower && bounds.upper && *bounds.lower > *bounds.upper) {
                throw DslError(ErrorKind::InvalidBounds, std::string(family),
                    std::format("lower bound {} of '{}' exceeds upper bound {}",
                                *bounds.lower, family, *bounds.upper));
            }
        }

        /**
         * @brief Declare (or re-declare) a family
         *
         * @details Re-declaring with the same type and arity returns the
         *          existing family; the first declaration's bound template and
         *          description are kept.
         *
         * @throws DslError(InvalidDeclaration) for a malformed name
         * @throws DslError(DuplicateFamily) for a conflicting type or arity
         * @throws DslError(InvalidBounds) see validateBounds
         */
        const VariableFamily& declareFamily(const std::string& name, VarType type,
                                            Bounds bounds = {}, std::string description = {},
                                            std::size_t arity = 0)
        {
            if (!isFamilyName(name)) {
                throw DslError(ErrorKind::InvalidDeclaration, name,
                    std::format("'{}' is not a valid variable family name", name));
            }
            validateBounds(name, type, bounds);

            if (auto it = familyIndex_.find(name); it != familyIndex_.end()) {
                const VariableFamily& existing = families_[it->second];
                if (existing.type() != type) {
                    throw DslError(ErrorKind::DuplicateFamily, name,
                        std::format("family '{}' already declared as {}, cannot redeclare as {}",
                                    name, to_string(existing.type()), to_string(type)));
                }
                if (existing.arity() != arity) {
                    throw DslError(ErrorKind::DuplicateFamily, name,
                        std::format("family '{}' already declared with {} indices, cannot redeclare with {}",
                                    name, existing.arity(), arity));
                }
                return existing;
            }

            familyIndex_.emplace(name, families_.size());
            families_.emplace_back(name, type, bounds, std::move(description), arity);
            return families_.back();
        }

        /**
         * @brief Record the values one declaration used at an index position
         */
        void declareDomain(std::string_view family, std::size_t position, std::vector<Scalar> values)
        {
            VariableFamily& f = familyMut(family);
            checkPosition(f, position);
            f.positions_[position].declared.push_back(std::move(values));
        }

        /**
         * @brief Get or create the instance for (family, index)
         *
         * @details New instances take the family bound template. Values at
         *          each position are recorded as observed.
         *
         * @throws DslError(UndefinedVariable) for an unknown family
         * @throws DslError(ArityMismatch) when the tuple length is wrong
         * @complexity O(log n) lookup
         * @note The reference is invalidated by the next instantiation.
         */
        const VariableInstance& instantiate(std::string_view family, const IndexTuple& index)
        {
            VariableFamily& f = familyMut(family);
            checkArity(f, index);
            if (auto it = f.byIndex_.find(index); it != f.byIndex_.end())
                return instances_[it->second];

            std::string description = f.description_;
            return create(f, index, f.bounds_, std::move(description));
        }

        /**
         * @brief Declaration-time instantiation with per-instance bounds
         *
         * @throws DslError(InvalidBounds) if the instance exists with other bounds
         */
        const VariableInstance& instantiate(std::string_view family, const IndexTuple& index,
                                            const Bounds& bounds, std::string description)
        {
            VariableFamily& f = familyMut(family);
            checkArity(f, index);
            validateBounds(f.name_, f.type_, bounds);

            if (auto it = f.byIndex_.find(index); it != f.byIndex_.end()) {
                const VariableInstance& existing = instances_[it->second];
                if (existing.bounds != bounds) {
                    throw DslError(ErrorKind::InvalidBounds, f.name_,
                        std::format("'{}' already exists with different bounds", existing.name));
                }
                return existing;
            }
            return create(f, index, bounds, std::move(description));
        }

        // --------------------------------------------------------------------
        // Lookup
        // --------------------------------------------------------------------

        [[nodiscard]] bool hasFamily(std::string_view name) const
        {
            return familyIndex_.find(name) != familyIndex_.end();
        }

        /// @brief Family by name, nullptr if unknown
        [[nodiscard]] const VariableFamily* family(std::string_view name) const
        {
            auto it = familyIndex_.find(name);
            return it == familyIndex_.end() ? nullptr : &families_[it->second];
        }

        /// @brief Existing instance, nullptr if not registered
        [[nodiscard]] const VariableInstance* find(std::string_view family, const IndexTuple& index) const
        {
            const VariableFamily* f = this->family(family);
            if (!f)
                return nullptr;
            auto it = f->byIndex_.find(index);
            return it == f->byIndex_.end() ? nullptr : &instances_[it->second];
        }

        [[nodiscard]] const VariableInstance* findByName(const std::string& name) const
        {
            auto it = byName_.find(name);
            return it == byName_.end() ? nullptr : &instances_[it->second];
        }

        /**
         * @brief Domain a wildcard ranges over at an index position
         *
         * @details Declared domains win over observed values. When several
         *          declarations recorded different value sets for the
         *          position, the domain is ambiguous.
         *
         * @throws DslError(UnresolvedWildcardDomain) when nothing is recorded
         *         or declared domains disagree
         */
        [[nodiscard]] std::vector<Scalar> wildcardDomain(std::string_view family, std::size_t position) const
        {
            const VariableFamily* f = this->family(family);
            if (!f) {
                throw DslError(ErrorKind::UndefinedVariable, std::string(family),
                    std::format("'{}' is not a declared variable family", family));
            }
            checkPosition(*f, position);

            const auto& pd = f->positions_[position];
            if (!pd.declared.empty()) {
                const std::set<Scalar> first(pd.declared.front().begin(), pd.declared.front().end());
                for (std::size_t k = 1; k < pd.declared.size(); ++k) {
                    const std::set<Scalar> other(pd.declared[k].begin(), pd.declared[k].end());
                    if (other != first) {
                        throw DslError(ErrorKind::UnresolvedWildcardDomain, std::string(family),
                            std::format("index position {} of '{}' was declared over different "
                                        "domains in different declarations", position + 1, family));
                    }
                }
                return pd.declared.front();
            }
            if (!pd.observed.empty())
                return pd.observed;

            throw DslError(ErrorKind::UnresolvedWildcardDomain, std::string(family),
                std::format("no domain is known for index position {} of '{}'", position + 1, family));
        }

        [[nodiscard]] const std::vector<VariableInstance>& instances() const noexcept { return instances_; }
        [[nodiscard]] const std::vector<VariableFamily>& families() const noexcept { return families_; }
        [[nodiscard]] std::size_t size() const noexcept { return instances_.size(); }
        [[nodiscard]] bool empty() const noexcept { return instances_.empty(); }

        [[nodiscard]] const VariableInstance& operator[](std::size_t id) const { return instances_.at(id); }

        // --------------------------------------------------------------------
        // Rollback
        // --------------------------------------------------------------------

        /// Sizes of every append-only part of the registry at one point in time
        struct Checkpoint {
            std::size_t families = 0;
            std::size_t instances = 0;
            /// Per family, per position: declared and observed domain counts
            std::vector<std::vector<std::pair<std::size_t, std::size_t>>> domains;
        };

        /// @complexity O(total family arity), independent of the instance count
        [[nodiscard]] Checkpoint checkpoint() const
        {
            Checkpoint cp{families_.size(), instances_.size(), {}};
            cp.domains.reserve(families_.size());
            for (const auto& f : families_) {
                auto& sizes = cp.domains.emplace_back();
                for (const auto& pd : f.positions_)
                    sizes.emplace_back(pd.declared.size(), pd.observed.size());
            }
            return cp;
        }

        /**
         * @brief Undo everything added since a checkpoint
         *
         * @details Instances, families and recorded domains are append-only,
         *          so rolling back removes the tail of each. The cost is
         *          proportional to what was added, not to the registry size.
         */
        void rollback(const Checkpoint& cp)
        {
            while (instances_.size() > cp.instances) {
                const VariableInstance& inst = instances_.back();
                VariableFamily& f = familyMut(inst.family);
                byName_.erase(inst.name);
                f.byIndex_.erase(inst.index);
                f.ids_.pop_back();
                instances_.pop_back();
            }
            while (families_.size() > cp.families) {
                familyIndex_.erase(families_.back().name_);
                families_.pop_back();
            }
            for (std::size_t i = 0; i < families_.size(); ++i) {
                auto& positions = families_[i].positions_;
                for (std::size_t p = 0; p < positions.size(); ++p) {
                    auto& pd = positions[p];
                    const auto [declared, observed] = cp.domains[i][p];
                    pd.declared.resize(declared);
                    while (pd.observed.size() > observed) {
                        pd.observedSet.erase(pd.observed.back());
                        pd.observed.pop_back();
                    }
                }
            }
        }

    private:
        VariableFamily& familyMut(std::string_view name)
        {
            auto it = familyIndex_.find(name);
            if (it == familyIndex_.end()) {
                throw DslError(ErrorKind::UndefinedVariable, std::string(name),
                    std::format("'{}' is not a declared variable family", name));
            }
            return families_[it->second];
        }

        static void checkArity(const VariableFamily& f, const IndexTuple& index)
        {
            if (index.size() != f.arity()) {
                throw DslError(ErrorKind::ArityMismatch, f.name(),
                    std::format("'{}' takes {} indices, got {} {}", f.name(), f.arity(),
                                index.size(), describeTuple(index)));
            }
        }

        static void checkPosition(const VariableFamily& f, std::size_t position)
        {
            if (position >= f.arity()) {
                throw DslError(ErrorKind::ArityMismatch, f.name(),
                    std::format("'{}' has no index position {}", f.name(), position + 1));
            }
        }

        const VariableInstance& create(VariableFamily& f, const IndexTuple& index,
                                       const Bounds& bounds, std::string description)
        {
            VariableInstance inst;
            inst.id = instances_.size();
            inst.family = f.name_;
            inst.index = index;
            inst.name = canonicalName(f.name_, index);
            inst.type = f.type_;
            inst.bounds = bounds;
            inst.description = std::move(description);

            byName_.emplace(inst.name, inst.id);
            f.byIndex_.emplace(index, inst.id);
            f.ids_.push_back(inst.id);
            for (std::size_t p = 0; p < index.size(); ++p) {
                auto& pd = f.positions_[p];
                if (pd.observedSet.insert(index[p]).second)
                    pd.observed.push_back(index[p]);
            }
            instances_.push_back(std::move(inst));
            return instances_.back();
        }

        std::vector<VariableFamily> families_;
        std::map<std::string, std::size_t, std::less<>> familyIndex_;
        std::vector<VariableInstance> instances_;
        std::unordered_map<std::string, std::size_t> byName_;
    };

} // namespace mipdsl
