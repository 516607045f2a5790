#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include "circuit/assigned.hpp"
#include "circuit/cell.hpp"
#include "circuit/value.hpp"
#include "plonk/column.hpp"

namespace plonkish {

/**
 * RegionLayouter<F> - Backend-facing side of a region under construction
 */
template<typename F>
class RegionLayouter {
public:
    virtual ~RegionLayouter() = default;

    virtual Cell assign_advice(const std::string& annotation, AdviceColumn column,
                               size_t offset, const Value<Assigned<F>>& value) = 0;

    virtual Cell assign_fixed(const std::string& annotation, FixedColumn column,
                              size_t offset, const Value<Assigned<F>>& value) = 0;

    virtual void constrain_equal(const Cell& left, const Cell& right) = 0;
};

/**
 * Region<F> - The view of a region given to a region body
 *
 * Offsets are relative to the region; the caller never picks absolute rows.
 * Every value closure is invoked exactly once, at assignment.
 */
template<typename F>
class Region {
public:
    explicit Region(RegionLayouter<F>& layouter) : layouter_(layouter) {}

    template<typename ToValue>
    AssignedCell<F> assign_advice(const std::string& annotation, AdviceColumn column,
                                  size_t offset, ToValue&& to) {
        Value<Assigned<F>> value = lift(to());
        Cell cell = layouter_.assign_advice(annotation, column, offset, value);
        return AssignedCell<F>{std::move(value), cell};
    }

    template<typename ToValue>
    AssignedCell<F> assign_fixed(const std::string& annotation, FixedColumn column,
                                 size_t offset, ToValue&& to) {
        Value<Assigned<F>> value = lift(to());
        Cell cell = layouter_.assign_fixed(annotation, column, offset, value);
        return AssignedCell<F>{std::move(value), cell};
    }

    void constrain_equal(const Cell& left, const Cell& right) {
        layouter_.constrain_equal(left, right);
    }

private:
    static Value<Assigned<F>> lift(Value<Assigned<F>> value) { return value; }
    static Value<Assigned<F>> lift(const Value<F>& value) { return value.template into<Assigned<F>>(); }

    RegionLayouter<F>& layouter_;
};

/**
 * Layouter<F> - Lays regions onto rows and binds cells to public inputs
 */
template<typename F>
class Layouter {
public:
    virtual ~Layouter() = default;

    /**
     * Run body against a fresh region named name and return what it returns.
     * An exception thrown by body aborts the region and propagates.
     */
    template<typename Body>
    auto assign_region(const std::string& name, Body&& body)
        -> std::invoke_result_t<Body, Region<F>&> {
        using R = std::invoke_result_t<Body, Region<F>&>;
        if constexpr (std::is_void_v<R>) {
            assign_region_impl(name, [&body](Region<F>& region) { body(region); });
        } else {
            std::optional<R> result;
            assign_region_impl(name, [&body, &result](Region<F>& region) {
                result.emplace(body(region));
            });
            return std::move(*result);
        }
    }

    // Constrain cell to equal row `row` of the instance column
    virtual void constrain_instance(const Cell& cell, InstanceColumn column, size_t row) = 0;

protected:
    virtual void assign_region_impl(const std::string& name,
                                    const std::function<void(Region<F>&)>& body) = 0;
};

} // namespace plonkish
