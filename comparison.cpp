#include "reflector.hpp"

namespace reflector
{

Result<Operator> parseOperator(std::string_view op)
{
    if (op == "=" || op == "==") return Operator::equal;
    if (op == "!=")              return Operator::notEqual;
    if (op == "<")               return Operator::less;
    if (op == "<=")              return Operator::lessEqual;
    if (op == ">")               return Operator::greater;
    if (op == ">=")              return Operator::greaterEqual;
    if (op == "like")            return Operator::like;

    return fail(ErrorKind::unknownOperator, std::format("\"{}\"", op));
}

std::string_view toString(Operator op)
{
    switch (op)
    {
        case Operator::equal:        return "=";
        case Operator::notEqual:     return "!=";
        case Operator::less:         return "<";
        case Operator::lessEqual:    return "<=";
        case Operator::greater:      return ">";
        case Operator::greaterEqual: return ">=";
        case Operator::like:         return "like";
    }

    return "?";
}

namespace
{
template <typename T>
Result<bool> evaluate(Operator op, T const& a, T const& b)
{
    switch (op)
    {
        case Operator::equal:        return a == b;
        case Operator::notEqual:     return a != b;
        case Operator::less:         return a < b;
        case Operator::lessEqual:    return a <= b;
        case Operator::greater:      return a > b;
        case Operator::greaterEqual: return a >= b;
        case Operator::like:
            if constexpr (std::is_same_v<T, std::string>)
                return a.find(b) != std::string::npos;
            else
                return fail(ErrorKind::invalidComparison, "like can only be used for text, not numbers");
    }

    return fail(ErrorKind::unknownOperator);
}

/// Timestamps become nanoseconds since the epoch, durations their count
Value reduce(Value const& v)
{
    if (auto const* ts = v.get<Timestamp>())
        return reflect(static_cast<std::int64_t>(ts->time_since_epoch().count()));

    if (v.isDuration())
        if (auto const n = v.metaType().number(v.unsafePointer()))
            return std::visit([] (auto x) { return reflect(x); }, *n);

    return v;
}

/// Pointers and dynamic boxes are followed one level
Value followed(Value const& v)
{
    if (v.isPointer() || v.isDynamic())
        return v.dereference();

    return v;
}

Error conversionError(Error const& e)
{
    return Error { .kind = ErrorKind::invalidComparison, .detail = std::format("conversion error: {}", e.message()) };
}
} // namespace

Result<Comparison> compare(Value const& lhs, Value const& rhs, std::string_view opText)
{
    auto const op = parseOperator(opText);

    if (! op)
        return std::unexpected(op.error());

    auto a = lhs;
    auto b = rhs;

    if (a.isDeepZero())
        a = reflect(0.0);

    a = followed(a);

    // a zero right operand swaps sides, the non-zero operand is then handled as the left one
    if (b.isDeepZero())
        b = std::exchange(a, reflect(0.0));

    b = followed(b);
    a = reduce(a);
    b = reduce(b);

    auto const finish = [op = *op] (Result<bool> result) -> Result<Comparison>
    {
        if (! result)
            return std::unexpected(std::move(result.error()));

        return Comparison { .result = *result, .op = op };
    };

    if (a.isNumeric() || b.isNumeric())
    {
        auto x = a.to<double>();
        if (! x) return std::unexpected(conversionError(x.error()));

        auto y = b.to<double>();
        if (! y) return std::unexpected(conversionError(y.error()));

        return finish(evaluate(*op, *x, *y));
    }

    if (a.isString())
    {
        auto y = b.to<std::string>();
        if (! y) return std::unexpected(conversionError(y.error()));

        return finish(evaluate(*op, *a.get<std::string>(), *y));
    }

    if (*op == Operator::equal || *op == Operator::notEqual)
    {
        auto y = b.convertToType(a.metaType());
        if (! y) return std::unexpected(conversionError(y.error()));

        auto const same = a.equals(*y);
        return finish(*op == Operator::equal ? same : ! same);
    }

    return fail(ErrorKind::invalidComparison, std::format("cannot compare {}({}) to {}({})", toString(a.kind()), a.toString(), toString(b.kind()), b.toString()));
}

} // namespace reflector
