//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.hpp
/// @brief Tree-walking evaluation, assignment and definedness probing.
///
/// @details Three entry points cover the interpretation protocol:
/// - evaluate(): run a node and produce its value;
/// - assign(): bind a value through a node used as an assignment target;
/// - definitionCheck(): classify what a node would denote, for `defined?`.
///
/// Failures surface as exceptions from Errors.hpp. evaluate() and assign()
/// let every exception propagate. definitionCheck() consumes a JumpSignal
/// raised while probing and rethrows everything else unchanged.
///
/// @invariant Evaluation never mutates the tree; all state lives in the
///            ExecContext.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Errors.hpp"
#include "interp/ExecContext.hpp"
#include "interp/Value.hpp"

#include <exception>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace garnet::ast
{
class Node;
} // namespace garnet::ast

namespace garnet::interp
{

/// @brief What a `defined?` probe found the operand to be.
enum class DefinitionKind : uint8_t
{
    Expression,
    LocalVariable,
    Assignment,
    Method,
    SelfRef,
};

/// @brief Text reported by `defined?`, e.g. "local-variable".
std::string_view toString(DefinitionKind kind) noexcept;

/// @brief Evaluate @p node in @p ctx.
/// @throws InternalError for structural-only nodes (parameter lists).
/// @throws LanguageError for user-level failures.
/// @throws JumpSignal for break, next and return.
Value evaluate(const garnet::ast::Node &node, ExecContext &ctx);

/// @brief Bind @p value through the assignment target @p node.
/// @param checkArity When true, a destructuring size mismatch raises
///        ArgumentError instead of padding with nil.
/// @return The assigned value.
/// @throws InternalError when @p node is not an assignment target.
Value assign(const garnet::ast::Node &node, ExecContext &ctx, Value value, bool checkArity);

/// @brief Result of evaluating a node for a definedness probe.
/// @details Exactly one of a value, an intercepted control transfer, or a
///          captured failure.
class EvalOutcome
{
  public:
    enum class Kind : uint8_t
    {
        Value,
        ControlTransfer,
        Failure,
    };

    static EvalOutcome ofValue(Value v)
    {
        return EvalOutcome(std::move(v));
    }

    static EvalOutcome ofTransfer(JumpSignal signal)
    {
        return EvalOutcome(std::move(signal));
    }

    static EvalOutcome ofFailure(std::exception_ptr failure)
    {
        return EvalOutcome(std::move(failure));
    }

    Kind kind() const noexcept
    {
        return static_cast<Kind>(state_.index());
    }

    /// @pre kind() == Kind::Value.
    const Value &value() const
    {
        return std::get<Value>(state_);
    }

    /// @pre kind() == Kind::ControlTransfer.
    const JumpSignal &transfer() const
    {
        return std::get<JumpSignal>(state_);
    }

    /// @brief Rethrow the captured failure.
    /// @pre kind() == Kind::Failure.
    [[noreturn]] void rethrow() const
    {
        std::rethrow_exception(std::get<std::exception_ptr>(state_));
    }

  private:
    explicit EvalOutcome(Value v) : state_(std::in_place_type<Value>, std::move(v)) {}

    explicit EvalOutcome(JumpSignal s) : state_(std::in_place_type<JumpSignal>, std::move(s)) {}

    explicit EvalOutcome(std::exception_ptr e)
        : state_(std::in_place_type<std::exception_ptr>, std::move(e))
    {
    }

    std::variant<Value, JumpSignal, std::exception_ptr> state_;
};

/// @brief Evaluate @p node for real and capture how it finished.
/// @details Side effects of the evaluation are kept; only the value is
///          reported back through the outcome.
EvalOutcome probe(const garnet::ast::Node &node, ExecContext &ctx);

/// @brief Classify @p node for `defined?`.
/// @return nullopt when the operand is undefined.
/// @throws Any failure other than a JumpSignal raised while probing.
std::optional<DefinitionKind> definitionCheck(const garnet::ast::Node &node, ExecContext &ctx);

} // namespace garnet::interp
