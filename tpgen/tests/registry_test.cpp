//! # Declaration Registry Tests

#include "model/registry.hpp"

#include <gtest/gtest.h>

using namespace tpgen;
using namespace tpgen::model;

namespace {

TracepointDecl plain(const char* name, const char* toggle = "") {
    TracepointDecl decl;
    decl.name = name;
    decl.toggle_name = toggle;
    return decl;
}

} // namespace

class RegistryTest : public ::testing::Test {
protected:
    DeclarationRegistry registry;
};

TEST_F(RegistryTest, PreservesRegistrationOrder) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("b"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("a"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("c"))));

    const auto& tps = registry.tracepoints();
    ASSERT_EQ(tps.size(), 3u);
    EXPECT_EQ(tps[0].name, "b");
    EXPECT_EQ(tps[1].name, "a");
    EXPECT_EQ(tps[2].name, "c");
}

TEST_F(RegistryTest, ReturnsPosition) {
    auto first = registry.register_tracepoint(plain("first"));
    auto second = registry.register_tracepoint(plain("second"));
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), 0u);
    EXPECT_EQ(unwrap(second), 1u);
}

TEST_F(RegistryTest, DuplicateNameLeavesRegistryUnchanged) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_blit", "blit"))));

    auto dup = plain("start_blit");
    dup.args.push_back(Arg{"uint8_t", "layers", "%u", "", "", ""});
    auto result = registry.register_tracepoint(dup);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "C001");
    EXPECT_EQ(unwrap_err(result).tracepoint, "start_blit");

    ASSERT_EQ(registry.tracepoints().size(), 1u);
    EXPECT_FALSE(registry.tracepoints()[0].has_payload());
}

TEST_F(RegistryTest, InvalidDeclarationLeavesRegistryUnchanged) {
    auto bad = plain("end_gmem_clear", "gmem_clear");
    bad.args.push_back(Arg{"uint8_t", "samples", "%s", "", "", ""});

    auto result = registry.register_tracepoint(bad);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "C004");
    EXPECT_TRUE(registry.tracepoints().empty());
    EXPECT_TRUE(registry.toggle_names().empty());
    EXPECT_FALSE(registry.contains("end_gmem_clear"));
}

TEST_F(RegistryTest, NameClashingWithToggleIsRejected) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_blit", "blit"))));

    auto result = registry.register_tracepoint(plain("blit"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "C001");
}

TEST_F(RegistryTest, TogglesDifferingOnlyInCaseRejected) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_blit", "blit"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("end_blit", "blit"))));

    auto result = registry.register_tracepoint(plain("start_Blit", "Blit"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "C001");
    EXPECT_EQ(unwrap_err(result).tracepoint, "start_Blit");
    EXPECT_EQ(registry.toggle_names(), std::vector<std::string>{"blit"});

    ASSERT_NE(registry.toggle_owning_constant("BLIT"), nullptr);
    EXPECT_EQ(*registry.toggle_owning_constant("BLIT"), "blit");
    EXPECT_EQ(registry.toggle_owning_constant("blit_3d"), nullptr);
}

TEST_F(RegistryTest, DuplicateExportNameRejected) {
    auto end = plain("end_blit", "blit");
    end.perfetto_name = "tu_end_blit";
    ASSERT_TRUE(is_ok(registry.register_tracepoint(end)));

    auto other = plain("other");
    other.perfetto_name = "tu_end_blit";
    auto result = registry.register_tracepoint(other);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "C001");
    EXPECT_FALSE(registry.contains("other"));

    other.perfetto_name = "tu_other";
    EXPECT_TRUE(is_ok(registry.register_tracepoint(other)));
}

TEST_F(RegistryTest, CheckDoesNotRegister) {
    EXPECT_FALSE(registry.check_tracepoint(plain("start_blit", "blit")));
    EXPECT_TRUE(registry.tracepoints().empty());
    EXPECT_TRUE(registry.toggle_names().empty());

    auto err = registry.check_tracepoint(plain("bad name"));
    ASSERT_TRUE(err);
    EXPECT_EQ(err->code, "C002");
}

TEST_F(RegistryTest, HeadersKeepOrderAndScope) {
    ASSERT_TRUE(is_ok(registry.register_header("util/u_dump.h")));
    ASSERT_TRUE(is_ok(registry.register_header("tu_private.h", HeaderScope::Source)));
    ASSERT_TRUE(is_ok(registry.register_header("vk_format.h", HeaderScope::Header)));
    ASSERT_TRUE(is_ok(registry.register_header("util/u_dump.h")));

    ASSERT_EQ(registry.headers().size(), 4u);

    auto pub = registry.headers(HeaderScope::Header);
    ASSERT_EQ(pub.size(), 3u);
    EXPECT_EQ(pub[0].path, "util/u_dump.h");
    EXPECT_EQ(pub[1].path, "vk_format.h");
    EXPECT_EQ(pub[2].path, "util/u_dump.h");

    auto src = registry.headers(HeaderScope::Source);
    ASSERT_EQ(src.size(), 1u);
    EXPECT_EQ(src[0].path, "tu_private.h");
}

TEST_F(RegistryTest, EmptyHeaderAndForwardDeclRejected) {
    auto header = registry.register_header("");
    ASSERT_TRUE(is_err(header));
    EXPECT_EQ(unwrap_err(header).code, "C003");

    auto fwd = registry.register_forward_decl("");
    ASSERT_TRUE(is_err(fwd));
    EXPECT_EQ(unwrap_err(fwd).code, "C003");

    EXPECT_TRUE(registry.headers().empty());
    EXPECT_TRUE(registry.forward_decls().empty());
}

TEST_F(RegistryTest, ForwardDecls) {
    ASSERT_TRUE(is_ok(registry.register_forward_decl("struct tu_device")));
    ASSERT_TRUE(is_ok(registry.register_forward_decl("struct tu_cmd_buffer")));
    ASSERT_EQ(registry.forward_decls().size(), 2u);
    EXPECT_EQ(registry.forward_decls()[0].decl, "struct tu_device");
    EXPECT_EQ(registry.forward_decls()[1].decl, "struct tu_cmd_buffer");
}

TEST_F(RegistryTest, FindAndContains) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_compute", "compute"))));

    EXPECT_TRUE(registry.contains("start_compute"));
    EXPECT_FALSE(registry.contains("end_compute"));

    const auto* tp = registry.find("start_compute");
    ASSERT_NE(tp, nullptr);
    EXPECT_EQ(tp->toggle_name, "compute");
    EXPECT_EQ(registry.find("end_compute"), nullptr);
}

TEST_F(RegistryTest, ToggleNamesInFirstAppearanceOrder) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_blit", "blit"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("end_blit", "blit"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("marker"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_compute", "compute"))));
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("end_compute", "compute"))));

    const auto& toggles = registry.toggle_names();
    ASSERT_EQ(toggles.size(), 2u);
    EXPECT_EQ(toggles[0], "blit");
    EXPECT_EQ(toggles[1], "compute");
}

TEST_F(RegistryTest, SealedRegistryRejectsEverything) {
    ASSERT_TRUE(is_ok(registry.register_tracepoint(plain("start_blit", "blit"))));
    registry.seal();
    EXPECT_TRUE(registry.is_sealed());

    auto tp = registry.register_tracepoint(plain("end_blit", "blit"));
    ASSERT_TRUE(is_err(tp));
    EXPECT_EQ(unwrap_err(tp).code, "C007");

    auto header = registry.register_header("late.h");
    ASSERT_TRUE(is_err(header));
    EXPECT_EQ(unwrap_err(header).code, "C007");

    auto fwd = registry.register_forward_decl("struct late");
    ASSERT_TRUE(is_err(fwd));
    EXPECT_EQ(unwrap_err(fwd).code, "C007");

    EXPECT_EQ(registry.tracepoints().size(), 1u);
    EXPECT_TRUE(registry.headers().empty());
}
