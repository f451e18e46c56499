#pragma once

namespace editable
{

//=============================================================================
// Value implementations
//=============================================================================
template <typename Lambda>
auto Value::visit(this auto&& self, Lambda && lambda)
{
    static constexpr auto kIsConst = std::is_const_v<std::remove_reference_t<decltype(self)>>;

    using AllArgumentRefs = std::conditional_t<kIsConst, typename detail::transform_tuple<SupportedFundamentalTypes, detail::add_const_lvalue_ref>::type,
                                                         typename detail::transform_tuple<SupportedFundamentalTypes, detail::add_lvalue_ref>::type>;
    using SupportedArgumentsByLambda = decltype(detail::filter_tuple<detail::DoesLambdaSupportType<Lambda>::template Predicate>(std::declval<AllArgumentRefs>()));
    static_assert(std::tuple_size_v<SupportedArgumentsByLambda> >= 1, "Your lambda must be callable with at least one of the types in SupportedFundamentalTypes");

    using LambdaReturnTypes = typename detail::transform_tuple<SupportedArgumentsByLambda, detail::BindFirst<std::invoke_result_t, Lambda>::template Result>::type;
    using LambdaReturnType = typename detail::apply_tuple<std::common_type, LambdaReturnTypes>::type::type;
    static constexpr auto kLambdaReturnsVoid = std::is_void_v<LambdaReturnType>;

    using ReturnType = std::conditional_t<kLambdaReturnsVoid, bool, std::optional<LambdaReturnType>>;

    return std::visit([&lambda] <typename T> (T& v) -> ReturnType
    {
        if constexpr (std::is_invocable_v<Lambda, T&>)
        {
            if constexpr (kLambdaReturnsVoid)
            {
                lambda(v);
                return true;
            }
            else
            {
                return ReturnType(lambda(v));
            }
        }

        return ReturnType{};
    }, self.underlying);
}

template <typename T>
T const& Value::as() const
{
    if (auto const* ptr = std::get_if<T>(&underlying))
        return *ptr;

    throw makeError<TypeError>("value {} of type '{}' was accessed as another type", repr(), typeName());
}

//=============================================================================
// Schema implementations
//=============================================================================
template <typename T>
Schema::Ptr Schema::fromStruct(std::string name, Validator validator, Flavor flavor)
{
    T const prototype{};

    std::vector<std::string> fieldnames;
    Options options = {.defaults = {}, .validator = std::move(validator), .flavor = flavor};

    std::apply([&fieldnames, &options] (auto const&... flds)
    {
        (fieldnames.emplace_back(flds.fieldname()), ...);
        (options.defaults.push_back(flds.initial), ...);
    }, detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(prototype)));

    return define(std::move(name), std::move(fieldnames), std::move(options));
}

template <typename Text> requires std::convertible_to<Text const&, std::string_view>
Schema::Ptr Schema::define(std::string name, Text const& fieldnames, Options options)
{
    if constexpr (std::is_pointer_v<Text>)
    {
        if (fieldnames == nullptr)
            throw makeError<ConfigurationError>("'{}' needs at least one field", name);
    }

    // a single entry is split on whitespace
    std::vector<std::string> elements = {std::string(std::string_view(fieldnames))};
    return define(std::move(name), std::move(elements), std::move(options));
}

//=============================================================================
// Record implementations
//=============================================================================
template <typename Lambda>
void Record::visitFields(Lambda && lambda) const
{
    auto const flds = meta->fields();

    for (std::size_t i = 0; i < flds.size(); ++i)
        lambda(std::string_view(flds[i].fieldname), values[i]);
}

template <typename Lambda>
auto Record::visitField(std::string_view fieldname, Lambda && lambda) const
{
    using LambdaReturnType = std::invoke_result_t<Lambda, Value const&>;
    static constexpr auto kLambdaReturnsVoid = std::is_same_v<LambdaReturnType, void>;

    using ReturnType = std::conditional_t<kLambdaReturnsVoid, bool, std::optional<LambdaReturnType>>;

    auto const idx = meta->indexOf(fieldname);

    if (! idx.has_value())
        return ReturnType{};

    if constexpr (kLambdaReturnsVoid)
    {
        lambda(values[*idx]);
        return true;
    }
    else
    {
        return ReturnType(lambda(values[*idx]));
    }
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// TypedRecord implementations
//=============================================================================

template <typename T>
auto TypedRecord<T>::fields_with(T& u)
{
    return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u));
}

template <typename T>
auto TypedRecord<T>::fields_with(T const& u)
{
    return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u));
}

template <typename T>
Schema::Ptr TypedRecord<T>::define(std::string name, Validator validator, Flavor flavor)
{
    return Schema::fromStruct<T>(std::move(name), std::move(validator), flavor);
}

template <typename T>
TypedRecord<T>::TypedRecord(Record record) : Record(std::move(record))
{
    auto const flds = schema().fields();
    auto const matches = std::equal(flds.begin(), flds.end(), kFieldNames.begin(), kFieldNames.end(),
                                    [] (FieldDescriptor const& fld, std::string_view fieldname) { return fld.fieldname == fieldname; });

    if (! matches)
        throw makeError<ConfigurationError>("the fields of '{}' do not match the layout of the typed record", typeName());
}

template <typename T>
TypedRecord<T>::TypedRecord(Schema::Ptr const& schema_, std::vector<Value> positional, Dict named)
    : TypedRecord(schema_->construct(std::move(positional), std::move(named)))
{}

template <typename T>
template <fixstr::fixed_string FieldName>
constexpr std::size_t TypedRecord<T>::fieldIndex()
{
    constexpr auto idx = detail::FieldIndex<FieldName, FieldsAsTuple>::value;
    static_assert(idx < std::tuple_size_v<FieldsAsTuple>, "no Field<> member with this name");
    return idx;
}

template <typename T>
template <fixstr::fixed_string FieldName>
Value const& TypedRecord<T>::operator()(CompileTimeString<FieldName>) const
{
    return this->values[fieldIndex<FieldName>()];
}

template <typename T>
template <fixstr::fixed_string FieldName>
Record::FieldRef TypedRecord<T>::operator()(CompileTimeString<FieldName>)
{
    return FieldRef(*this, fieldIndex<FieldName>());
}

} // namespace editable

//=============================================================================
// std::formatter implementations
//=============================================================================

inline auto std::formatter<editable::Value>::format(editable::Value const& v, format_context& ctx) const
{
    return std::formatter<string>::format(v.str(), ctx);
}

inline auto std::formatter<editable::Record>::format(editable::Record const& r, format_context& ctx) const
{
    return std::formatter<string>::format(r.describe(), ctx);
}
