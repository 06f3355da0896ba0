#include "common/ResultEnvelope.h"
#include <gtest/gtest.h>

namespace JAIL {
namespace Test {

TEST(ResultEnvelopeTest, UndefinedBecomesNull) {
    EXPECT_EQ(makeResultEnvelope("undefined"), R"({"result":null})");
    EXPECT_EQ(makeResultEnvelope(""), R"({"result":null})");
}

TEST(ResultEnvelopeTest, JsonTextIsEmbedded) {
    EXPECT_EQ(makeResultEnvelope(R"({"ping":{}})"), R"({"result":{"ping":{}}})");
    EXPECT_EQ(makeResultEnvelope("42"), R"({"result":42})");
    EXPECT_EQ(makeResultEnvelope(R"("pong")"), R"({"result":"pong"})");
}

TEST(ResultEnvelopeTest, PlainTextIsCarriedAsString) {
    EXPECT_EQ(makeResultEnvelope("pong"), R"({"result":"pong"})");
}

TEST(ResultEnvelopeTest, ErrorMessageIsEscaped) {
    EXPECT_EQ(makeErrorEnvelope("Cell[a] doesn't exist."), R"({"error":"Cell[a] doesn't exist."})");
    EXPECT_EQ(makeErrorEnvelope(R"(bad "quote")"), R"({"error":"bad \"quote\""})");
}

}  // namespace Test
}  // namespace JAIL
