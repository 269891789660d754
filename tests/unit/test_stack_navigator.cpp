#include <catch2/catch_test_macros.hpp>
#include <stepwise/debug/stack_navigator.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include "../test_main.cpp"

using namespace stepwise::debug;

namespace {

stack_frame make_frame(std::string id, std::string name, std::string source, uint32_t line,
                       std::optional<uint32_t> column = std::nullopt) {
    stack_frame f;
    f.id = std::move(id);
    f.name = std::move(name);
    f.source = std::move(source);
    f.line = line;
    f.column = column;
    return f;
}

} // namespace

TEST_CASE("stack_navigator formats frames", "[debug][navigator]") {
    REQUIRE(stack_navigator::format_frame(make_frame("1", "main", "main.lua", 5)) == "main.lua:5 in main chunk");
    REQUIRE(stack_navigator::format_frame(make_frame("1", "", "main.lua", 5)) == "main.lua:5 in main chunk");
    REQUIRE(stack_navigator::format_frame(make_frame("2", "helper", "helper.lua", 10, 5)) ==
            "helper.lua:10:5 in helper");
    REQUIRE(stack_navigator::format_frame(make_frame("3", "?", "lib.lua", 2)) == "lib.lua:2 (tail call)");

    auto native = make_frame("4", "print", "[C]", 0);
    native.is_user_code = false;
    REQUIRE(stack_navigator::format_frame(native) == "[C]:0 in print [native]");
}

TEST_CASE("stack_navigator marks the current frame", "[debug][navigator]") {
    std::vector<stack_frame> stack{
        make_frame("1", "main", "main.lua", 5),
        make_frame("2", "helper", "helper.lua", 10, 5),
    };

    REQUIRE(stack_navigator::format_stack_trace(stack, 1) ==
            "   #0 main.lua:5 in main chunk\n"
            "-> #1 helper.lua:10:5 in helper\n");
    REQUIRE(stack_navigator::format_stack_trace(stack, 0) ==
            "-> #0 main.lua:5 in main chunk\n"
            "   #1 helper.lua:10:5 in helper\n");
    REQUIRE(stack_navigator::format_stack_trace({}, 0).empty());
}

TEST_CASE("stack_navigator three frame trace", "[debug][navigator]") {
    std::vector<stack_frame> stack{
        make_frame("3", "main", "main.lua", 1),
        make_frame("2", "helper", "helper.lua", 10, 5),
        make_frame("1", "util", "util.lua", 20),
    };

    auto out = stack_navigator::format_stack_trace(stack, 1);
    REQUIRE(out ==
            "   #0 main.lua:1 in main chunk\n"
            "-> #1 helper.lua:10:5 in helper\n"
            "   #2 util.lua:20 in util\n");
    REQUIRE(out.find("helper.lua:10:5 in helper") != std::string::npos);
}

TEST_CASE("stack_navigator navigate_to_frame bounds", "[debug][navigator]") {
    std::vector<stack_frame> stack{make_frame("1", "main", "main.lua", 1)};

    auto ok = stack_navigator::navigate_to_frame(0, stack);
    REQUIRE(ok.has_value());
    REQUIRE(ok->source == "main.lua");

    auto bad = stack_navigator::navigate_to_frame(1, stack);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error() == debug_errc::not_found);

    REQUIRE_FALSE(stack_navigator::navigate_to_frame(0, {}).has_value());
}

TEST_CASE("stack_navigator frame variables", "[debug][navigator]") {
    auto frame = make_frame("1", "main", "main.lua", 3);
    frame.locals = {
        {.name = "y", .value = "2", .type = "number"},
        {.name = "x", .value = "1", .type = "number"},
    };
    std::vector<variable> watches{
        {.name = "total", .value = "3", .type = "number"},
        {.name = "x", .value = "shadowed", .type = "string"},
    };

    auto locals = stack_navigator::get_frame_variables(frame);
    REQUIRE(locals == frame.locals);

    auto with_watches = stack_navigator::get_frame_variables(frame, variable_context::locals_and_watches, watches);
    REQUIRE(with_watches.size() == 3);
    REQUIRE(with_watches[2].name == "total");
    REQUIRE(with_watches[2].value == "3");
    // Locals win over a watch of the same name
    REQUIRE(stack_navigator::find_frame_variable(frame, "x")->value == "1");
    REQUIRE(std::count_if(with_watches.begin(), with_watches.end(),
                          [](const variable& v) { return v.name == "x"; }) == 1);
}

TEST_CASE("stack_navigator keeps shadowed locals", "[debug][navigator]") {
    auto frame = make_frame("1", "main", "main.lua", 7);
    frame.locals = {
        {.name = "x", .value = "1", .type = "number"},
        {.name = "t", .value = "table: 0x1", .type = "table", .has_children = true, .reference = 4},
        {.name = "x", .value = "2", .type = "number"},
    };

    auto vars = stack_navigator::get_frame_variables(frame);
    REQUIRE(vars.size() == 3);
    REQUIRE(vars == frame.locals);
    REQUIRE(vars[1].has_children);
    REQUIRE(vars[1].reference == 4);

    auto visible = stack_navigator::find_frame_variable(frame, "x");
    REQUIRE(visible.has_value());
    REQUIRE(visible->value == "2");

    auto missing = stack_navigator::find_frame_variable(frame, "nope");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error() == debug_errc::not_found);
}

TEST_CASE("stack_navigator round trip leaves the snapshot untouched", "[debug][navigator]") {
    std::vector<stack_frame> stack;
    for (int i = 0; i < 3; ++i) {
        auto f = make_frame(std::to_string(i), "f" + std::to_string(i), "m.lua", static_cast<uint32_t>(i + 1));
        f.locals = {{.name = "depth", .value = std::to_string(i), .type = "number"},
                    {.name = "name", .value = "f" + std::to_string(i), .type = "string"}};
        stack.push_back(std::move(f));
    }
    auto before = stack;

    for (size_t i = 0; i < stack.size(); ++i) {
        auto frame = stack_navigator::navigate_to_frame(i, stack);
        REQUIRE(frame.has_value());
        auto vars = stack_navigator::get_frame_variables(*frame);
        REQUIRE(vars == stack[i].locals);
    }
    for (size_t i = 0; i < stack.size(); ++i) {
        REQUIRE(stack[i].locals == before[i].locals);
    }
}

TEST_CASE("stack_navigator walks 100 frames quickly", "[debug][navigator]") {
    std::vector<stack_frame> stack;
    for (uint32_t i = 0; i < 100; ++i) {
        stack.push_back(make_frame(std::to_string(i), "fn" + std::to_string(i), "deep.lua", i + 1));
    }

    auto start = std::chrono::steady_clock::now();
    size_t found = 0;
    for (size_t i = 0; i < stack.size(); ++i) {
        if (stack_navigator::navigate_to_frame(i, stack)) ++found;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(found == 100);
    REQUIRE(elapsed < stepwise::test::scaled_ms(1));
}

TEST_CASE("navigator_cursor moves between frames", "[debug][navigator]") {
    navigator_cursor cursor({
        make_frame("3", "inner", "c.lua", 30),
        make_frame("2", "middle", "b.lua", 20),
        make_frame("1", "main", "a.lua", 10),
    });
    REQUIRE(cursor.depth() == 3);
    REQUIRE(cursor.current() == 0);
    REQUIRE_FALSE(cursor.down().has_value());

    REQUIRE(cursor.up()->name == "middle");
    REQUIRE(cursor.up()->name == "main");
    REQUIRE(cursor.current() == 2);

    auto past = cursor.up();
    REQUIRE(past.error() == debug_errc::not_found);
    REQUIRE(cursor.current() == 2);

    REQUIRE(cursor.down()->name == "middle");
    REQUIRE(cursor.frame()->source == "b.lua");
    REQUIRE(cursor.format().find("-> #1 b.lua:20 in middle") != std::string::npos);

    cursor.reset({make_frame("9", "main", "a.lua", 11)});
    REQUIRE(cursor.current() == 0);
    REQUIRE(cursor.frame()->line == 11);
}
