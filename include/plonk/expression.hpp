#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include "plonk/column.hpp"

namespace plonkish {

/**
 * Query - A reference to the cell at (column, current row + rotation)
 */
struct Query {
    AnyColumn column;
    Rotation rotation;

    bool operator==(const Query& rhs) const {
        return column == rhs.column && rotation == rhs.rotation;
    }
    bool operator<(const Query& rhs) const {
        if (column != rhs.column) return column < rhs.column;
        return rotation < rhs.rotation;
    }
};

/**
 * Expression<F> - Polynomial over queried cells
 *
 * A gate constraint holds on a row when its expression evaluates to zero there.
 * Nodes are immutable and shared, so copying an expression is cheap.
 */
template<typename F>
class Expression {
public:
    enum class Kind {
        Constant,
        Fixed,
        Advice,
        Instance,
        Negated,
        Sum,
        Product,
        Scaled
    };

    static Expression constant(const F& value) {
        auto node = std::make_shared<Node>(Kind::Constant);
        node->constant = value;
        return Expression(std::move(node));
    }

    static Expression query(const Query& q) {
        Kind kind = Kind::Advice;
        switch (q.column.type) {
            case ColumnType::Advice: kind = Kind::Advice; break;
            case ColumnType::Fixed: kind = Kind::Fixed; break;
            case ColumnType::Instance: kind = Kind::Instance; break;
        }
        auto node = std::make_shared<Node>(kind);
        node->query = q;
        return Expression(std::move(node));
    }

    Kind kind() const { return node_->kind; }

    /**
     * Polynomial degree in the queried cells. Fixed, advice and instance
     * queries all count as degree 1.
     */
    size_t degree() const {
        switch (node_->kind) {
            case Kind::Constant: return 0;
            case Kind::Fixed:
            case Kind::Advice:
            case Kind::Instance: return 1;
            case Kind::Negated:
            case Kind::Scaled: return node_->lhs.degree();
            case Kind::Sum: return std::max(node_->lhs.degree(), node_->rhs.degree());
            case Kind::Product: return node_->lhs.degree() + node_->rhs.degree();
        }
        return 0;
    }

    /**
     * Evaluate with query_value resolving every queried cell.
     */
    F evaluate(const std::function<F(const Query&)>& query_value) const {
        switch (node_->kind) {
            case Kind::Constant: return node_->constant;
            case Kind::Fixed:
            case Kind::Advice:
            case Kind::Instance: return query_value(node_->query);
            case Kind::Negated: return -node_->lhs.evaluate(query_value);
            case Kind::Sum:
                return node_->lhs.evaluate(query_value) + node_->rhs.evaluate(query_value);
            case Kind::Product:
                return node_->lhs.evaluate(query_value) * node_->rhs.evaluate(query_value);
            case Kind::Scaled: return node_->lhs.evaluate(query_value) * node_->constant;
        }
        return F::zero();
    }

    // Visits every query in the expression, in left-to-right order
    void for_each_query(const std::function<void(const Query&)>& visit) const {
        switch (node_->kind) {
            case Kind::Constant: return;
            case Kind::Fixed:
            case Kind::Advice:
            case Kind::Instance: visit(node_->query); return;
            case Kind::Negated:
            case Kind::Scaled: node_->lhs.for_each_query(visit); return;
            case Kind::Sum:
            case Kind::Product:
                node_->lhs.for_each_query(visit);
                node_->rhs.for_each_query(visit);
                return;
        }
    }

    /**
     * Render the expression, e.g. "sl * l + sr * r". name_of maps a query to
     * its display name; rotations other than cur are appended as "@rot".
     */
    std::string to_string(const std::function<std::string(const AnyColumn&)>& name_of) const {
        std::ostringstream os;
        switch (node_->kind) {
            case Kind::Constant:
                os << node_->constant;
                break;
            case Kind::Fixed:
            case Kind::Advice:
            case Kind::Instance:
                os << name_of(node_->query.column);
                if (node_->query.rotation.value != 0) {
                    os << "@" << node_->query.rotation.value;
                }
                break;
            case Kind::Negated:
                os << "-(" << node_->lhs.to_string(name_of) << ")";
                break;
            case Kind::Sum:
                os << node_->lhs.to_string(name_of) << " + " << node_->rhs.to_string(name_of);
                break;
            case Kind::Product:
                os << wrap(node_->lhs, name_of) << " * " << wrap(node_->rhs, name_of);
                break;
            case Kind::Scaled:
                os << wrap(node_->lhs, name_of) << " * " << node_->constant;
                break;
        }
        return os.str();
    }

    Expression operator+(const Expression& rhs) const { return binary(Kind::Sum, *this, rhs); }
    Expression operator-(const Expression& rhs) const { return binary(Kind::Sum, *this, -rhs); }
    Expression operator*(const Expression& rhs) const { return binary(Kind::Product, *this, rhs); }

    Expression operator*(const F& scalar) const {
        auto node = std::make_shared<Node>(Kind::Scaled);
        node->lhs = *this;
        node->constant = scalar;
        return Expression(std::move(node));
    }

    Expression operator-() const {
        auto node = std::make_shared<Node>(Kind::Negated);
        node->lhs = *this;
        return Expression(std::move(node));
    }

private:
    struct Node;

    Expression() = default;
    explicit Expression(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    static Expression binary(Kind kind, const Expression& lhs, const Expression& rhs) {
        auto node = std::make_shared<Node>(kind);
        node->lhs = lhs;
        node->rhs = rhs;
        return Expression(std::move(node));
    }

    static std::string wrap(const Expression& e,
                            const std::function<std::string(const AnyColumn&)>& name_of) {
        if (e.kind() == Kind::Sum) {
            return "(" + e.to_string(name_of) + ")";
        }
        return e.to_string(name_of);
    }

    std::shared_ptr<const Node> node_;
};

template<typename F>
struct Expression<F>::Node {
    explicit Node(Kind k) : kind(k), constant(F::zero()) {}

    Kind kind;
    F constant;             // Constant value or Scaled factor
    Query query;            // Fixed / Advice / Instance
    Expression<F> lhs;      // Negated, Sum, Product, Scaled
    Expression<F> rhs;      // Sum, Product
};

} // namespace plonkish
