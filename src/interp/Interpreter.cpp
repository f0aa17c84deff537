//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.cpp
/// @brief Evaluation visitor plus the assignment and definedness passes.
///
/// @details evaluate() routes through an Evaluator implementing
/// NodeVisitor<Value>; assign() and definitionCheck() switch over NodeKind
/// directly. None of the switches has a default label, so a kind added to
/// NodeKinds.def must be handled in each pass.
///
//===----------------------------------------------------------------------===//

#include "interp/Interpreter.hpp"

#include "ast/NodeVisitor.hpp"
#include "support/feature_flags.hpp"

#include <string>
#include <utility>
#include <vector>

namespace garnet::interp
{

using namespace garnet::ast;

namespace
{

[[noreturn]] void notInterpretable(const Node &node)
{
    throw InternalError(std::string(toString(node.kind())) + " should not be directly interpreted");
}

[[noreturn]] void notAssignable(const Node &node)
{
    throw InternalError("Invalid node encountered in interpreter: \"" +
                        std::string(toString(node.kind())) + "\"");
}

std::string arityMessage(std::size_t given, std::size_t expected)
{
    return "wrong number of arguments (given " + std::to_string(given) + ", expected " +
           std::to_string(expected) + ")";
}

Value evaluateOptional(const NodePtr &node, ExecContext &ctx)
{
    return node ? evaluate(*node, ctx) : Value::nil();
}

/// @brief Evaluation pass; one handler per node kind.
class Evaluator final : public NodeVisitor<Value>
{
  public:
    explicit Evaluator(ExecContext &ctx) : ctx_(ctx) {}

    Value visitNil(const NilNode &) override
    {
        return Value::nil();
    }

    Value visitTrue(const TrueNode &) override
    {
        return Value::boolean(true);
    }

    Value visitFalse(const FalseNode &) override
    {
        return Value::boolean(false);
    }

    Value visitFixnum(const FixnumNode &node) override
    {
        return Value::integer(node.value);
    }

    Value visitStr(const StrNode &node) override
    {
        return Value::string(node.value);
    }

    Value visitSymbol(const SymbolNode &node) override
    {
        return Value::symbol(node.name);
    }

    Value visitDSymbol(const DSymbolNode &node) override
    {
        std::string text;
        for (const auto &part : node.parts)
            text += evaluate(*part, ctx_).toDisplayString();
        return Value::symbol(std::move(text));
    }

    Value visitArray(const ArrayNode &node) override
    {
        std::vector<Value> elems;
        elems.reserve(node.elements.size());
        for (const auto &e : node.elements)
            elems.push_back(evaluate(*e, ctx_));
        return Value::array(std::move(elems));
    }

    Value visitSelf(const SelfNode &) override
    {
        return ctx_.self();
    }

    Value visitLocalVar(const LocalVarNode &node) override
    {
        if (const Value *v = ctx_.lookupLocal(node.name))
            return *v;
        throw LanguageError(ErrorClass::NameError,
                            "undefined local variable or method '" + node.name + "'",
                            node.loc());
    }

    Value visitLocalAsgn(const LocalAsgnNode &node) override
    {
        return assign(node, ctx_, evaluateOptional(node.value, ctx_), false);
    }

    Value visitMultipleAsgn(const MultipleAsgnNode &node) override
    {
        Value rhs = evaluateOptional(node.value, ctx_);
        assign(node, ctx_, rhs, false);
        return rhs;
    }

    Value visitBlock(const BlockNode &node) override
    {
        Value result;
        for (const auto &stmt : node.statements)
        {
            if (stmt->isNilLiteral())
            {
                result = Value::nil();
                continue;
            }
            result = evaluate(*stmt, ctx_);
        }
        return result;
    }

    Value visitNewline(const NewlineNode &node) override
    {
        return evaluate(*node.statement, ctx_);
    }

    Value visitBreak(const BreakNode &node) override
    {
        throw JumpSignal(JumpKind::Break, evaluateOptional(node.value, ctx_), node.loc());
    }

    Value visitNext(const NextNode &node) override
    {
        throw JumpSignal(JumpKind::Next, evaluateOptional(node.value, ctx_), node.loc());
    }

    Value visitReturn(const ReturnNode &node) override
    {
        throw JumpSignal(JumpKind::Return, evaluateOptional(node.value, ctx_), node.loc());
    }

    Value visitDefined(const DefinedNode &node) override
    {
        if (auto kind = definitionCheck(*node.expression, ctx_))
            return Value::string(std::string(toString(*kind)));
        return Value::nil();
    }

    Value visitFCall(const FCallNode &node) override
    {
        DefinitionScope *scope = ctx_.currentDefiningScope();
        const DefnNode *method = scope ? scope->findMethod(node.name) : nullptr;
        if (!method)
        {
            throw LanguageError(
                ErrorClass::NoMethodError, "undefined method '" + node.name + "'", node.loc());
        }

        std::vector<Value> args;
        args.reserve(node.args.size());
        for (const auto &a : node.args)
            args.push_back(evaluate(*a, ctx_));

        const auto &params = method->args->arguments;
        if (args.size() != params.size())
        {
            throw LanguageError(
                ErrorClass::ArgumentError, arityMessage(args.size(), params.size()), node.loc());
        }

        FrameGuard frame(ctx_, ctx_.self());
        for (std::size_t i = 0; i < params.size(); ++i)
            ctx_.setLocal(params[i]->name, std::move(args[i]));

        try
        {
            return evaluateOptional(method->body, ctx_);
        }
        catch (const JumpSignal &jump)
        {
            if (jump.kind != JumpKind::Return)
                throw;
            return jump.value;
        }
    }

    Value visitClass(const ClassNode &node) override
    {
        DefinitionScope *super = nullptr;
        if (node.superName)
        {
            super = ctx_.findScope(*node.superName);
            if (!super)
            {
                throw LanguageError(ErrorClass::NameError,
                                    "uninitialized constant " + *node.superName,
                                    node.loc());
            }
        }

        DefinitionScope *scope = ctx_.findScope(node.name);
        if (scope)
        {
            if (node.superName && scope->superScope() != super)
            {
                throw LanguageError(ErrorClass::TypeError,
                                    "superclass mismatch for class " + node.name,
                                    node.loc());
            }
        }
        else
        {
            scope = &ctx_.defineScope(node.name, super);
        }

        DefiningScopeGuard open(ctx_, *scope);
        FrameGuard frame(ctx_, Value::scope(*scope));
        return evaluateOptional(node.body, ctx_);
    }

    Value visitDefn(const DefnNode &node) override
    {
        DefinitionScope *scope = ctx_.currentDefiningScope();
        if (!scope)
        {
            throw LanguageError(ErrorClass::TypeError,
                                "no class to define method '" + node.name + "' in",
                                node.loc());
        }
        scope->defineMethod(node.name, node);
        return Value::symbol(node.name);
    }

    Value visitArgs(const ArgsNode &node) override
    {
        notInterpretable(node);
    }

    Value visitArgument(const ArgumentNode &node) override
    {
        notInterpretable(node);
    }

    Value visitUndef(const UndefNode &node) override
    {
        DefinitionScope *scope = ctx_.currentDefiningScope();
        if (!scope)
            throw LanguageError(ErrorClass::TypeError, "no class to undef method in", node.loc());

        scope->undef(methodName(*node.name), node.loc());
        return Value::nil();
    }

  private:
    /// @brief Name designated by an undef operand.
    /// @details A plain symbol is used directly; any other operand is
    ///          evaluated and must produce a symbol or string.
    std::string methodName(const Node &operand)
    {
        if (const auto *sym = nodeDynCast<SymbolNode>(operand))
            return sym->name;

        Value v = evaluate(operand, ctx_);
        if (v.kind() != Value::Kind::Symbol && v.kind() != Value::Kind::String)
        {
            throw LanguageError(
                ErrorClass::TypeError, v.inspect() + " is not a symbol nor a string", operand.loc());
        }
        return v.text();
    }

    ExecContext &ctx_;
};

} // namespace

std::string_view toString(DefinitionKind kind) noexcept
{
    switch (kind)
    {
        case DefinitionKind::Expression:
            return "expression";
        case DefinitionKind::LocalVariable:
            return "local-variable";
        case DefinitionKind::Assignment:
            return "assignment";
        case DefinitionKind::Method:
            return "method";
        case DefinitionKind::SelfRef:
            return "self";
    }
    return "expression";
}

Value evaluate(const Node &node, ExecContext &ctx)
{
    DepthGuard depth(ctx, node);
#if GARNET_EVAL_TRACE
    ctx.trace().onEval(node);
#endif
    Evaluator evaluator(ctx);
    return dispatch(node, evaluator);
}

Value assign(const Node &node, ExecContext &ctx, Value value, bool checkArity)
{
    switch (node.kind())
    {
        case NodeKind::LocalAsgn:
            ctx.setLocal(nodeCast<LocalAsgnNode>(node).name, value);
            return value;
        case NodeKind::MultipleAsgn:
        {
            const auto &targets = nodeCast<MultipleAsgnNode>(node).targets;
            std::vector<Value> wrapped;
            if (value.kind() != Value::Kind::Array)
                wrapped.push_back(value);
            const std::vector<Value> &items =
                value.kind() == Value::Kind::Array ? value.elements() : wrapped;

            if (checkArity && items.size() != targets.size())
            {
                throw LanguageError(ErrorClass::ArgumentError,
                                    arityMessage(items.size(), targets.size()),
                                    node.loc());
            }
            for (std::size_t i = 0; i < targets.size(); ++i)
                assign(*targets[i], ctx, i < items.size() ? items[i] : Value::nil(), false);
            return value;
        }
        case NodeKind::Nil:
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Fixnum:
        case NodeKind::Str:
        case NodeKind::Symbol:
        case NodeKind::DSymbol:
        case NodeKind::Array:
        case NodeKind::Self:
        case NodeKind::LocalVar:
        case NodeKind::Block:
        case NodeKind::Newline:
        case NodeKind::Break:
        case NodeKind::Next:
        case NodeKind::Return:
        case NodeKind::Defined:
        case NodeKind::FCall:
        case NodeKind::Class:
        case NodeKind::Defn:
        case NodeKind::Args:
        case NodeKind::Argument:
        case NodeKind::Undef:
            notAssignable(node);
    }
    notAssignable(node);
}

EvalOutcome probe(const Node &node, ExecContext &ctx)
{
    try
    {
        return EvalOutcome::ofValue(evaluate(node, ctx));
    }
    catch (const JumpSignal &jump)
    {
        return EvalOutcome::ofTransfer(jump);
    }
    catch (const std::exception &)
    {
        return EvalOutcome::ofFailure(std::current_exception());
    }
}

std::optional<DefinitionKind> definitionCheck(const Node &node, ExecContext &ctx)
{
    switch (node.kind())
    {
        case NodeKind::Nil:
            return DefinitionKind::Expression;
        case NodeKind::Self:
            return DefinitionKind::SelfRef;
        case NodeKind::LocalVar:
            if (ctx.hasLocal(nodeCast<LocalVarNode>(node).name))
                return DefinitionKind::LocalVariable;
            return std::nullopt;
        case NodeKind::LocalAsgn:
        case NodeKind::MultipleAsgn:
            return DefinitionKind::Assignment;
        case NodeKind::FCall:
        {
            const auto &call = nodeCast<FCallNode>(node);
            const DefinitionScope *scope = ctx.currentDefiningScope();
            if (!scope || !scope->hasMethod(call.name))
                return std::nullopt;
            for (const auto &arg : call.args)
            {
                if (!definitionCheck(*arg, ctx))
                    return std::nullopt;
            }
            return DefinitionKind::Method;
        }
        case NodeKind::Newline:
            return definitionCheck(*nodeCast<NewlineNode>(node).statement, ctx);
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Fixnum:
        case NodeKind::Str:
        case NodeKind::Symbol:
        case NodeKind::DSymbol:
        case NodeKind::Array:
        case NodeKind::Block:
        case NodeKind::Break:
        case NodeKind::Next:
        case NodeKind::Return:
        case NodeKind::Defined:
        case NodeKind::Class:
        case NodeKind::Defn:
        case NodeKind::Args:
        case NodeKind::Argument:
        case NodeKind::Undef:
            break;
    }

    EvalOutcome outcome = probe(node, ctx);
    switch (outcome.kind())
    {
        case EvalOutcome::Kind::Value:
            return DefinitionKind::Expression;
        case EvalOutcome::Kind::ControlTransfer:
            return std::nullopt;
        case EvalOutcome::Kind::Failure:
            outcome.rethrow();
    }
    return std::nullopt;
}

} // namespace garnet::interp
