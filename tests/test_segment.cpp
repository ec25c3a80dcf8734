#include <catch2/catch_test_macros.hpp>

#include "segment.hpp"

#include <string>
#include <vector>

namespace {

Segment make_segment(int32_t id, std::string text) {
    Segment s;
    s.id = id;
    s.start = id;
    s.end = id + 1.0;
    s.text = std::move(text);
    return s;
}

} // namespace

TEST_CASE("Segments", "[segment]") {

    SECTION("EmptyResult") {
        Segments result;
        REQUIRE(result.empty());
        REQUIRE(result.text().empty());
        REQUIRE(result.to_string().empty());
    }

    SECTION("TextIsOrderedJoinWithoutSeparator") {
        Segments result({make_segment(0, " the quick"), make_segment(1, " brown"),
                         make_segment(2, " fox")});
        REQUIRE(result.size() == 3);
        REQUIRE(result.text() == " the quick brown fox");
        REQUIRE(result.to_string() == result.text());

        std::string joined;
        for (const auto& s : result) joined += s.text;
        REQUIRE(joined == result.text());
    }

    SECTION("KeepsOrderAndDuplicates") {
        Segments result({make_segment(2, "c"), make_segment(0, "a"), make_segment(0, "a")});
        REQUIRE(result.text() == "caa");
        REQUIRE(result.segments()[0].id == 2);
        REQUIRE(result.segments()[1].id == 0);
        REQUIRE(result.segments()[2].id == 0);
    }

    SECTION("EmptyTextSegments") {
        Segments result({make_segment(0, ""), make_segment(1, "x"), make_segment(2, "")});
        REQUIRE(result.size() == 3);
        REQUIRE(result.text() == "x");
    }
}

TEST_CASE("Segments to_json", "[segment]") {
    Segment s;
    s.id = 3;
    s.seek = 1500;
    s.start = 0.5;
    s.end = 2.25;
    s.text = " hello";
    s.temperature = 0.2;
    s.avg_logprob = -0.5;
    s.compression_ratio = 1.25;
    s.no_speech_prob = 0.125;

    auto j = to_json(Segments({s}));
    REQUIRE(j["text"] == " hello");
    REQUIRE(j["segments"].size() == 1);

    auto& seg = j["segments"][0];
    REQUIRE(seg["id"] == 3);
    REQUIRE(seg["seek"] == 1500);
    REQUIRE(seg["start"].get<double>() == 0.5);
    REQUIRE(seg["end"].get<double>() == 2.25);
    REQUIRE(seg["text"] == " hello");
    REQUIRE(seg["temperature"].get<double>() == 0.2);
    REQUIRE(seg["avg_logprob"].get<double>() == -0.5);
    REQUIRE(seg["compression_ratio"].get<double>() == 1.25);
    REQUIRE(seg["no_speech_prob"].get<double>() == 0.125);
}
