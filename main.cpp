#include <iostream>
#include <format>
#include "editable.hpp"

// Example usage
using namespace editable;

struct Rgb
{
    Field<"red">   red   {0};
    Field<"green"> green {0};
    Field<"blue">  blue  {0};
};

Value validateRgba(std::string_view name, Value const& value)
{
    auto const number = value.number();

    if (name == "alpha")
    {
        if (! number || *number < 0.0 || *number > 1.0)
            return 1.0;
    }
    else if (! number || *number < 0 || *number > 255)
    {
        throw ValidationError(name, value, std::format("color value must be 0-255, got {}", value));
    }

    return value;
}

void basicExamples()
{
    std::cout << "=== Records ===\n\n";

    auto Options = Schema::define("Options", "maxcolors shape zoom restore");
    auto options = Options->construct({5, "square", 0.9, true});
    std::cout << options << std::endl;

    options.set("maxcolors", 7);
    options("restore") = false;
    options[2] -= 0.1;
    std::cout << options << std::endl;

    auto Rgb = Schema::define("Rgb", "red green blue", {.defaults = {0, 0, 0}});
    std::cout << Rgb->construct() << std::endl;
    std::cout << Rgb->construct({238, 130, 238}) << std::endl;

    auto navy = Rgb->construct({}, {{"blue", 128}});
    std::cout << navy << std::endl;

    for (auto const& [fieldname, value] : navy.toDict())
        std::cout << "  " << fieldname << " = " << value << "\n";
}

void validatorExamples(Flavor flavor)
{
    std::cout << std::format("\n=== Validated records ({}) ===\n\n", flavor == Flavor::indexable ? "indexable" : "plain");

    auto Rgba = Schema::define("Rgba", {"red", "green", "blue", "alpha"},
                               {.defaults = {0, 0, 0, 1.0}, .validator = validateRgba, .flavor = flavor});

    auto color = Rgba->construct({}, {{"green", 99}});
    std::cout << color << std::endl;

    color.set("red", 128);
    color("blue") = 240;
    color("alpha") = 7.5;
    std::cout << color << std::endl;

    try
    {
        color("green") = 299;
    }
    catch (ValidationError const& e)
    {
        std::cout << "rejected " << e.value() << " for " << e.fieldname() << ": " << e.what() << std::endl;
    }

    if (! Rgba->isIndexable())
    {
        try
        {
            static_cast<void>(color.at(0));
        }
        catch (OperationNotSupportedError const& e)
        {
            std::cout << e.what() << std::endl;
        }

        return;
    }

    color[2] = 200;
    color.setAt(-1, 0.5);
    std::cout << color << std::endl;

    std::cout << "first three:";
    for (auto const& v : color.slice({.stop = 3}))
        std::cout << " " << v;
    std::cout << "\n";

    color.assignSlice({.stop = 2}, std::vector<Value>{10, 20});
    std::cout << color << " has " << color.size() << " fields, contains 20: " << color.contains(20) << std::endl;
}

void comparisonExamples()
{
    std::cout << "\n=== Comparison ===\n\n";

    auto Point = Schema::define("Point", "x y");
    auto const a = Point->construct({3, 4});
    auto const b = Point->construct({3, 5});

    std::cout << std::format("{} < {}: {}\n", a, b, a < b);
    std::cout << std::format("{} == {}: {}\n", a, Point->construct(a.toTuple()), a == Point->construct(a.toTuple()));

    auto const v = Schema::define("Vector", "x y")->construct({3, 4});
    std::cout << std::format("{} == {}: {}\n", a, v, a == v);
}

void typedExamples()
{
    std::cout << "\n=== TypedRecord ===\n\n";

    for (auto const& key : TypedRecord<::Rgb>::kFieldNames)
        std::cout << key << std::endl;

    TypedRecord<::Rgb> color(TypedRecord<::Rgb>::define("Rgb"), {}, {{"blue", 128}});
    color("red"_fld) = 7;

    std::cout << std::format("{}", color) << std::endl;
    std::cout << "red is " << std::as_const(color)("red"_fld) << std::endl;
}

int main()
{
    try
    {
        basicExamples();
        validatorExamples(Flavor::indexable);
        validatorExamples(Flavor::plain);
        comparisonExamples();
        typedExamples();
    }
    catch (Error const& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
