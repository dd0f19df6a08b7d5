#include "reflector.hpp"
#include <algorithm>
#include <numeric>

namespace reflector
{

Result<SequenceView> SequenceView::of(Value const& value)
{
    if (! value.isValid())
        return fail(ErrorKind::invalidValue, "cannot view an absent value as a sequence");

    auto target = value;

    if (target.isDynamic() || (target.isPointer() && target.metaType().elementMetaType()->kind() == Kind::sequence))
    {
        target = target.dereference();

        if (! target.isValid())
            return fail(ErrorKind::invalidValue, std::format("cannot view a nil {} as a sequence", value.metaType().name()));
    }

    if (! target.isSequence())
        return fail(ErrorKind::notASequence, std::format("{} is not a sequence", target.metaType().name()));

    return SequenceView(std::move(target));
}

std::size_t SequenceView::length() const
{
    return sequence.length();
}

std::size_t SequenceView::capacity() const
{
    return metaType().capacity(sequence.unsafePointer());
}

Result<SequenceView> SequenceView::makeNew() const
{
    auto fresh = Value::create(metaType());

    if (! fresh.isValid())
        return fail(ErrorKind::invalidValue, std::format("{} is not default constructible", metaType().name()));

    return SequenceView(std::move(fresh));
}

Value SequenceView::index(std::size_t i) const
{
    return sequence.index(i);
}

Result<void> SequenceView::setIndex(std::size_t i, Value const& newValue)
{
    if (i >= length())
        return fail(ErrorKind::indexOutOfBounds, std::format("index {} with length {}", i, length()));

    return index(i).set(newValue);
}

Result<void> SequenceView::swap(std::size_t i, std::size_t j)
{
    if (i >= length() || j >= length())
        return fail(ErrorKind::indexOutOfBounds, std::format("swapping {} and {} with length {}", i, j, length()));

    if (i == j)
        return {};

    auto const first = index(i).clone();

    if (auto result = setIndex(i, index(j)); ! result)
        return result;

    return setIndex(j, first);
}

std::vector<Value> SequenceView::items() const
{
    std::vector<Value> result;
    result.reserve(length());

    for (std::size_t i = 0; i < length(); ++i)
    {
        auto item = index(i);
        result.push_back(item.isDynamic() ? item.dereference() : item);
    }

    return result;
}

Result<void> SequenceView::append(std::span<Value const> values)
{
    if (! canAppend())
        return fail(ErrorKind::cannotAppendToNonReference, std::format("{} is not addressable", metaType().name()));

    std::vector<Value> elements;
    elements.reserve(values.size());

    for (auto const& value : values)
    {
        if (! value.isValid())
            return fail(ErrorKind::invalidValue, "cannot append an absent value");

        if (value.metaType() == elementType())
        {
            elements.push_back(value);
            continue;
        }

        if (elementType().kind() != Kind::dynamic)
            return fail(ErrorKind::typeMismatch, std::format("expected {} but got {}", elementType().name(), value.metaType().name()));

        auto boxed = reflector::convertToType(value, elementType());

        if (! boxed)
            return std::unexpected(std::move(boxed.error()));

        elements.push_back(std::move(*boxed));
    }

    for (auto const& element : elements)
        if (! metaType().append(sequence.unsafePointer(), element.unsafePointer()))
            return fail(ErrorKind::typeMismatch, std::format("{} is not copy constructible", elementType().name()));

    return {};
}

Result<Value> SequenceView::convertToType(MetaType const& sequenceType) const
{
    return reflector::convertToType(sequence, sequenceType);
}

Result<SequenceView> SequenceView::filterBy(Predicate const& predicate) const
{
    if (length() < 1)
        return *this;

    auto filtered = makeNew();

    if (! filtered)
        return filtered;

    auto const elements = items();

    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        auto include = predicate(elements[i]);

        if (! include)
            return std::unexpected(std::move(include.error()));

        if (! *include)
            continue;

        auto const element = index(i);

        if (auto result = filtered->append(std::span(&element, 1)); ! result)
            return std::unexpected(std::move(result.error()));
    }

    return filtered;
}

namespace
{
/**
 * @brief Stable bottom-up merge sort of an index permutation
 *
 * Every access stays within bounds whatever the predicate answers, so
 * inconsistent predicates merely produce an unspecified order.
 */
template <typename Less>
void mergeSort(std::vector<std::size_t>& order, Less&& less)
{
    std::vector<std::size_t> merged(order.size());

    for (std::size_t width = 1; width < order.size(); width *= 2)
    {
        for (std::size_t lo = 0; lo < order.size(); lo += 2 * width)
        {
            auto const mid = std::min(lo + width, order.size());
            auto const hi = std::min(lo + 2 * width, order.size());
            auto i = lo, j = mid, k = lo;

            while (i < mid && j < hi)
                merged[k++] = less(order[j], order[i]) ? order[j++] : order[i++];

            while (i < mid) merged[k++] = order[i++];
            while (j < hi)  merged[k++] = order[j++];
        }

        order.swap(merged);
    }
}

/// The named field of a record, record pointer or string-keyed map, dynamic boxes unwrapped
Value fieldOf(Value item, std::string_view name)
{
    if (item.isRecordPointer())
        item = item.dereference();

    Value result;

    if (item.isRecord())
        result = item.field(name);
    else if (item.isMap())
        result = item.mapIndex(reflect(std::string(name)));

    return result.isDynamic() && ! result.isNil() ? result.dereference() : result;
}

Operator sortOperator(bool ascending)
{
    return ascending ? Operator::less : Operator::greater;
}
} // namespace

Result<void> SequenceView::permute(std::vector<std::size_t> const& order)
{
    std::vector<Value> snapshot;
    snapshot.reserve(order.size());

    for (std::size_t i = 0; i < order.size(); ++i)
    {
        auto copy = index(i).clone();

        if (! copy.isValid())
            return fail(ErrorKind::unsettable, std::format("{} is not copy constructible", elementType().name()));

        snapshot.push_back(std::move(copy));
    }

    for (std::size_t i = 0; i < order.size(); ++i)
        if (order[i] != i)
            if (auto result = index(i).set(snapshot[order[i]]); ! result)
                return result;

    return {};
}

Result<void> SequenceView::sortBy(Less const& less)
{
    if (length() < 2)
        return {};

    auto const elements = items();
    std::vector<std::size_t> order(elements.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    std::optional<Error> failure;

    mergeSort(order, [&] (std::size_t x, std::size_t y)
    {
        if (failure)
            return false;

        auto result = less(elements[x], elements[y]);

        if (! result)
        {
            failure = std::move(result.error());
            return false;
        }

        return *result;
    });

    if (failure)
    {
        SPDLOG_LOGGER_DEBUG(logger(), "sorting {} aborted: {}", metaType().name(), failure->message());
        return std::unexpected(std::move(*failure));
    }

    return permute(order);
}

Result<void> SequenceView::sortByFieldFunc(std::string_view fieldname, Less const& less)
{
    if (length() < 1)
        return {};

    auto const first = items().front();

    if (first.isRecord() || first.isRecordPointer())
    {
        auto view = first.toStruct();

        if (! view)
            return std::unexpected(std::move(view.error()));

        if (! view->hasField(fieldname))
            return fail(ErrorKind::unknownField, std::string(fieldname));
    }
    else if (! first.isMap())
        return fail(ErrorKind::notARecord, std::format("cannot sort {} by field", metaType().name()));

    return sortBy([fieldname, &less] (Value const& a, Value const& b)
    {
        return less(fieldOf(a, fieldname), fieldOf(b, fieldname));
    });
}

Result<void> SequenceView::sortByField(std::string_view fieldname, bool ascending)
{
    auto const op = toString(sortOperator(ascending));

    return sortByFieldFunc(fieldname, [op] (Value const& a, Value const& b)
    {
        return a.compareTo(b, op);
    });
}

Result<void> sortRecords(SequenceView& view, std::string_view fieldname, bool ascending)
{
    if (view.length() < 1)
        return fail(ErrorKind::invalidValue, "cannot sort an empty sequence");

    std::optional<Value> key;

    for (auto const& item : view.items())
    {
        auto record = item.toStruct();

        if (! record)
            return fail(ErrorKind::notARecord, record.error().detail);

        auto fieldValue = record->fieldValue(fieldname);

        if (! fieldValue)
            return std::unexpected(std::move(fieldValue.error()));

        if (! key)
            key = *fieldValue;
    }

    auto const op = toString(sortOperator(ascending));

    if (auto self = key->compareTo(*key, op); ! self)
        return fail(ErrorKind::invalidComparison, std::format("field {} is not comparable: {}", fieldname, self.error().message()));

    return view.sortByField(fieldname, ascending);
}

} // namespace reflector
