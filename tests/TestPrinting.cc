#include <gtest/gtest.h>

#include <sstream>
#include "sv-core/printing.hh"
#include "sv-core/vm.hh"
#include "sv-core/interp.hh"
#include "sv-core/error.hh"

///
/// RENDERING TESTS
///

TEST(PrintingTests, Scalars) {
    sv::VirtualMachine vm;
    EXPECT_EQ(vm.display(vm.push_value(sv::Value::make_int(42))), "42i");
    EXPECT_EQ(vm.display(vm.push_value(sv::Value::make_int(-3))), "-3i");
    EXPECT_EQ(vm.display(vm.push_value(sv::Value::make_float(2.0f))), "2f");
    EXPECT_EQ(vm.display(vm.push_value(sv::Value::make_float(0.25f))), "0.25f");
}

TEST(PrintingTests, NestedStructsCommaSeparated) {
    sv::VirtualMachine vm{sv::VmConfig{100, true}};
    sv::ObjectID a = vm.push_value(sv::Value::make_int(1));
    sv::ObjectID b = vm.push_value(sv::Value::make_float(1.5f));
    sv::ObjectID empty = vm.push_value(sv::Value::make_struct({}));
    sv::ObjectID inner = vm.push_value(sv::Value::make_struct({b, empty}));
    sv::ObjectID outer = vm.push_value(sv::Value::make_struct({a, inner, a}));

    EXPECT_EQ(vm.display(outer), "Struct(1i, Struct(1.5f, Struct()), 1i)");
}

TEST(PrintingTests, PrintToStream) {
    sv::VirtualMachine vm;
    sv::ObjectID id = vm.push_value(sv::Value::make_int(5));
    std::stringstream ss;
    vm.print(id, ss);
    EXPECT_EQ(ss.str(), "5i");
}

TEST(PrintingTests, FailedStreamIsIoError) {
    sv::VirtualMachine vm;
    sv::ObjectID id = vm.push_value(sv::Value::make_int(5));
    std::stringstream ss;
    ss.setstate(std::ios::badbit);
    try {
        vm.print(id, ss);
        FAIL() << "expected VmError";
    } catch (sv::VmError const& e) {
        EXPECT_EQ(e.kind(), sv::VmErrorKind::IO);
    }
}

TEST(PrintingTests, ValueChildren) {
    sv::VirtualMachine vm{sv::VmConfig{100, true}};
    sv::ObjectID a = vm.push_value(sv::Value::make_int(1));
    sv::ObjectID b = vm.push_value(sv::Value::make_int(2));
    sv::Value s = sv::Value::make_struct({a, b});

    EXPECT_EQ(s.children(), (std::vector<sv::ObjectID>{a, b}));
    EXPECT_TRUE(sv::Value::make_int(1).children().empty());
    EXPECT_TRUE(sv::Value::make_float(1.0f).children().empty());
    EXPECT_EQ(sv::value_kind_name(s.kind()), "Struct");
}

TEST(PrintingTests, FloatsKeepAllSignificantDigits) {
    sv::VirtualMachine vm{sv::VmConfig{100, true}};
    auto shown = [&vm] (sv::f32 v) { return vm.display(vm.push_value(sv::Value::make_float(v))); };
    EXPECT_EQ(shown(1234567.0f), "1234567f");
    EXPECT_EQ(shown(16777216.0f), "16777216f");
    EXPECT_EQ(shown(1e10f), "10000000000f");
    EXPECT_EQ(shown(0.1f), "0.1f");
    EXPECT_EQ(shown(3.1415927f), "3.1415927f");
    EXPECT_EQ(shown(-0.5f), "-0.5f");
}

TEST(PrintingTests, FloatResultOfRunIsExact) {
    auto interp = sv::Interpreter::load({sv::Instruction::const_float(1234567.0f)});
    ASSERT_TRUE(interp != nullptr);
    EXPECT_EQ(interp->display(interp->run()), "1234567f");
}
