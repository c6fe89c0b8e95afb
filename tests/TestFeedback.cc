#include <gtest/gtest.h>

#include <sstream>
#include "sv-core/feedback.hh"
#include "sv-core/error.hh"
#include "sv-core/vcode.hh"

///
/// FEEDBACK, ERROR TEXT, AND DISASSEMBLY TESTS
///

class FeedbackTests: public ::testing::Test {
protected:
    std::stringstream m_out;
    void SetUp() override {
        sv::set_feedback_stream(&m_out);
    }
    void TearDown() override {
        sv::set_feedback_stream(nullptr);
        sv::set_debug_feedback(false);
    }
};

TEST_F(FeedbackTests, PrefixesAndContinuation) {
    sv::error("bad\nthing");
    sv::warning("careful");
    sv::info("fyi");
    EXPECT_EQ(m_out.str(), "ERROR: bad\n       thing\nWARN:  careful\nINFO:  fyi\n");
}

TEST_F(FeedbackTests, DebugIsGated) {
    sv::set_debug_feedback(false);
    sv::debug("hidden");
    EXPECT_EQ(m_out.str(), "");

    sv::set_debug_feedback(true);
    sv::debug("shown");
    EXPECT_EQ(m_out.str(), "DEBUG: shown\n");
}

TEST_F(FeedbackTests, ThrownErrorsAreReported) {
    EXPECT_THROW(sv::throw_unresolved_label("nope"), sv::VmError);
    EXPECT_EQ(m_out.str(), "ERROR: Unresolved label nope\n");
}

TEST(ErrorTextTests, MessagesPerKind) {
    EXPECT_STREQ(sv::VmError(sv::VmErrorKind::StackUnderflow).what(), "Interpreter stack underflow");
    EXPECT_STREQ(sv::VmError(sv::VmErrorKind::InvalidInstructionPointer).what(), "Invalid instruction pointer state");
    EXPECT_STREQ(sv::VmError(sv::VmErrorKind::IO, "disk").what(), "IO error: disk");
    EXPECT_STREQ(sv::vm_error_kind_name(sv::VmErrorKind::ValueMismatch), "ValueMismatch");
}

TEST(DisassemblyTests, OneInstructionEach) {
    auto text = [] (sv::Instruction const& instr) {
        std::stringstream ss;
        ss << instr;
        return ss.str();
    };
    EXPECT_EQ(text(sv::Instruction::const_int(-4)), "(const-int -4)");
    EXPECT_EQ(text(sv::Instruction::const_float(1.5f)), "(const-float 1.5)");
    EXPECT_EQ(text(sv::Instruction::const_float(1234567.0f)), "(const-float 1234567)");
    EXPECT_EQ(text(sv::Instruction::push_struct(3)), "(push-struct 3)");
    EXPECT_EQ(text(sv::Instruction::get_local(0)), "(get-local 0)");
    EXPECT_EQ(text(sv::Instruction::jmp_cmp("loop")), "(jmp-cmp loop)");
    EXPECT_EQ(text(sv::Instruction::call("f", 2)), "(call #:label f #:n 2)");
    EXPECT_EQ(text(sv::Instruction::cge()), "(c-ge)");
    EXPECT_EQ(text(sv::Instruction::ret()), "(return)");
}

TEST(DisassemblyTests, Equality) {
    EXPECT_EQ(sv::Instruction::call("f", 2), sv::Instruction::call("f", 2));
    EXPECT_NE(sv::Instruction::call("f", 2), sv::Instruction::call("f", 1));
    EXPECT_NE(sv::Instruction::const_int(1), sv::Instruction::const_float(1.0f));
    EXPECT_EQ(sv::Instruction::iadd(), sv::Instruction::iadd());
}
