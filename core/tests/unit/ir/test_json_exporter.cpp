// tests/ir/test_json_exporter.cpp - Unit tests for the pil-stark JSON export
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "pilc/ir/json_exporter.hpp"
#include "pilc/test_support/pil_builder.hpp"

using namespace pilc;
using nlohmann::json;
using test_support::PilBuilder;

namespace
{

/// namespace Fib(4);
/// pol constant ISLAST = [0, 0, 0, 1];
/// pol commit x, y;
/// pol prod = x * y;
/// (1 - ISLAST) * (x' - y) = 0;
/// { x } in { ISLAST };
/// public out = y(3);
json export_fibonacci()
{
  PilBuilder b;
  b.ns("Fib", 4)
    .fixed_array("ISLAST", {{{b.num(0), b.num(0), b.num(0), b.num(1)}, false}})
    .commit({"x", "y"})
    .intermediate("prod", b.mul(b.ref("x"), b.ref("y")))
    .identity(b.mul(b.sub(b.num(1), b.ref("ISLAST")), b.sub(b.next("x"), b.ref("y"))))
    .plookup(b.selected({b.ref("x")}), b.selected({b.ref("ISLAST")}))
    .public_decl("out", b.ref("y"), 3);
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  EXPECT_TRUE(result.success);
  auto exported = export_json(*result.analyzed);
  EXPECT_TRUE(exported.has_value()) << (exported ? "" : exported.error());
  return exported ? std::move(exported).value() : json{};
}

}  // namespace

TEST(IrJsonExporter, Counts)
{
  const json out = export_fibonacci();
  EXPECT_EQ(out["nCommitments"], 2);
  EXPECT_EQ(out["nConstants"], 1);
  EXPECT_EQ(out["nIm"], 1);
  EXPECT_EQ(out["nQ"], 0);
}

TEST(IrJsonExporter, References)
{
  const json out = export_fibonacci();
  const json & refs = out["references"];
  ASSERT_TRUE(refs.is_object());
  EXPECT_EQ(refs.size(), 4U);

  EXPECT_EQ(refs["Fib.y"]["type"], "cmP");
  EXPECT_EQ(refs["Fib.y"]["id"], 1);
  EXPECT_EQ(refs["Fib.y"]["polDeg"], 4);
  EXPECT_EQ(refs["Fib.y"]["isArray"], false);
  EXPECT_TRUE(refs["Fib.y"]["len"].is_null());
  EXPECT_EQ(refs["Fib.ISLAST"]["type"], "constP");
  EXPECT_EQ(refs["Fib.prod"]["type"], "imP");
}

TEST(IrJsonExporter, IntermediatesComeFirstInExpressions)
{
  const json out = export_fibonacci();
  const json & expressions = out["expressions"];
  ASSERT_TRUE(expressions.is_array());
  ASSERT_GE(expressions.size(), 1U);

  const json & prod = expressions[0];
  EXPECT_EQ(prod["op"], "mul");
  EXPECT_EQ(prod["deg"], 2);
  EXPECT_EQ(prod["values"][0]["op"], "cm");
  EXPECT_EQ(prod["values"][1]["id"], 1);
}

TEST(IrJsonExporter, PolynomialIdentity)
{
  const json out = export_fibonacci();
  const json & identities = out["polIdentities"];
  ASSERT_EQ(identities.size(), 1U);

  const auto index = identities[0]["e"].get<size_t>();
  const json & e = out["expressions"].at(index);
  EXPECT_EQ(e["op"], "mul");
  EXPECT_EQ(e["deg"], 2);

  const json & transition = e["values"][1];
  EXPECT_EQ(transition["op"], "sub");
  EXPECT_EQ(transition["values"][0], (json{{"op", "cm"}, {"deg", 1}, {"id", 0}, {"next", true}}));

  const json & one = e["values"][0]["values"][0];
  EXPECT_EQ(one["op"], "number");
  EXPECT_EQ(one["value"], "1");
}

TEST(IrJsonExporter, PlookupAndPublics)
{
  const json out = export_fibonacci();
  ASSERT_EQ(out["plookupIdentities"].size(), 1U);
  const json & lookup = out["plookupIdentities"][0];
  EXPECT_TRUE(lookup["selF"].is_null());
  EXPECT_TRUE(lookup["selT"].is_null());
  ASSERT_EQ(lookup["f"].size(), 1U);
  ASSERT_EQ(lookup["t"].size(), 1U);
  EXPECT_EQ(out["expressions"].at(lookup["t"][0].get<size_t>())["op"], "const");

  ASSERT_EQ(out["publics"].size(), 1U);
  const json & pub = out["publics"][0];
  EXPECT_EQ(pub["name"], "out");
  EXPECT_EQ(pub["polType"], "cmP");
  EXPECT_EQ(pub["polId"], 1);
  EXPECT_EQ(pub["idx"], 3);

  EXPECT_TRUE(out["permutationIdentities"].empty());
  EXPECT_TRUE(out["connectionIdentities"].empty());
}

TEST(IrJsonExporter, ArrayElementIds)
{
  PilBuilder b;
  b.ns("Main", 2).commit({"x"}).commit_array("a", 3);
  b.identity(b.at("a", 2), b.ref("x"));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);
  const auto out = export_json(*result.analyzed);
  ASSERT_TRUE(out.has_value());

  EXPECT_EQ(out.value()["references"]["Main.a"]["len"], 3);
  EXPECT_EQ(out.value()["nCommitments"], 4);
  const auto index = out.value()["polIdentities"][0]["e"].get<size_t>();
  EXPECT_EQ(out.value()["expressions"][index]["values"][0]["id"], 3);
}

TEST(IrJsonExporter, UnsupportedOperatorIsAnError)
{
  PilBuilder b;
  b.ns("Main", 2).commit({"x"});
  b.identity(b.div(b.ref("x"), b.num(2)));
  DiagnosticBag diags;
  const auto result = b.analyze(diags);
  ASSERT_TRUE(result.success);

  const auto out = export_json(*result.analyzed);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), "Unsupported expression in JSON export: (Main.x / 2)");
}
