#include <doctest/doctest.h>
#include <pngchunk/builder.hh>
#include <pngchunk/reader.hh>
#include <pngchunk/exceptions.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::string types_of(const builder& b) {
        std::string out;
        for (std::size_t i = 0; i < b.size(); i++) {
            if (!out.empty()) out += ',';
            out += b.type_at(i).to_string();
        }
        return out;
    }

    builder open_builder(const std::vector<std::byte>& data, const builder_options& opts = {}) {
        reader r(data);
        return builder::from_reader(r, opts);
    }
}

TEST_CASE("Builder - removing and inserting") {
    auto data = three_chunk_png();
    auto b = open_builder(data);
    REQUIRE(b.size() == 3);

    SUBCASE("remove a middle chunk") {
        b.remove(1);
        CHECK(b.size() == 2);
        CHECK(b.finalize() == minimal_png());
    }

    SUBCASE("insert a text chunk after the header") {
        b.insert_after(0, "tEXt"_ct, to_payload("hello"));
        auto out = b.finalize();

        auto chunks = reader(out).collect_all();
        REQUIRE(chunks.size() == 4);
        CHECK(chunks[1].type == "tEXt"_ct);
        CHECK(as_text(chunks[1].payload) == "hello");
        CHECK(chunks[1].stored_crc == 0x5A80F362u);
        CHECK(out == make_png({{"tEXt", "hello"}, {"IDAT", "abcd"}}));
    }

    SUBCASE("insert before") {
        b.insert_before(1, "tEXt"_ct, to_payload("hello"));
        CHECK(types_of(b) == "IHDR,tEXt,IDAT,IEND");
        b.insert_before(3, "IDAT"_ct, to_payload("efgh"));
        CHECK(types_of(b) == "IHDR,tEXt,IDAT,IDAT,IEND");
        CHECK(b.finalize() == make_png({{"tEXt", "hello"}, {"IDAT", "abcd"}, {"IDAT", "efgh"}}));
    }

    SUBCASE("indices shift immediately") {
        b.insert_after(0, "tEXt"_ct, to_payload("a"));   // IHDR tEXt IDAT IEND
        b.remove(1);                                     // IHDR IDAT IEND
        b.insert_after(1, "tEXt"_ct, to_payload("b"));   // IHDR IDAT tEXt IEND
        b.remove(0);                                     // IDAT tEXt IEND
        b.insert_before(0, "IHDR"_ct, ihdr_payload());   // IHDR IDAT tEXt IEND
        CHECK(types_of(b) == "IHDR,IDAT,tEXt,IEND");
        CHECK(as_text(b.payload_at(2)) == "b");
        CHECK(b.finalize() == make_png({{"IDAT", "abcd"}, {"tEXt", "b"}}));
    }

    SUBCASE("entry ids are stable") {
        auto text = b.insert_after(0, "tEXt"_ct, to_payload("a"));
        CHECK(b.index_of(text) == 1);
        b.remove(0);
        CHECK(b.index_of(text) == 0);
        b.insert_before(0, "IHDR"_ct, ihdr_payload());
        CHECK(b.index_of(text) == 1);
        b.remove(1);
        CHECK_FALSE(b.index_of(text).has_value());
    }

    SUBCASE("append places the chunk last") {
        b.remove(2);
        b.append("tEXt"_ct, to_payload("end"));
        b.append("IEND"_ct, {});
        CHECK(types_of(b) == "IHDR,IDAT,tEXt,IEND");
    }
}

TEST_CASE("Builder - replace and reorder") {
    auto data = make_png({{"tEXt", "a"}, {"IDAT", "abcd"}});
    auto b = open_builder(data);

    SUBCASE("replace keeps the position and the id") {
        const auto id = b.log().at(1).id;
        REQUIRE(b.is_borrowed(1));
        b.replace(1, "tEXt"_ct, to_payload("hello"));
        CHECK_FALSE(b.is_borrowed(1));
        CHECK(b.index_of(id) == 1);
        CHECK(b.finalize() == make_png({{"tEXt", "hello"}, {"IDAT", "abcd"}}));
    }

    SUBCASE("reorder") {
        b.reorder({0, 2, 1, 3});
        CHECK(types_of(b) == "IHDR,IDAT,tEXt,IEND");
        CHECK(b.finalize() == make_png({{"IDAT", "abcd"}, {"tEXt", "a"}}));
    }

    SUBCASE("reorder after a removal uses current indices") {
        b.remove(1);
        b.insert_before(2, "tEXt"_ct, to_payload("z"));   // IHDR IDAT tEXt IEND
        b.reorder({0, 2, 1, 3});
        CHECK(types_of(b) == "IHDR,tEXt,IDAT,IEND");
        CHECK(b.log().entry_count() == 4);
    }

    SUBCASE("invalid permutation leaves the builder unchanged") {
        CHECK_THROWS_AS(b.reorder({0, 1, 2}), invalid_permutation_error);
        CHECK_THROWS_AS(b.reorder({0, 0, 1, 2}), invalid_permutation_error);
        CHECK_THROWS_AS(b.reorder({0, 1, 2, 7}), invalid_permutation_error);
        CHECK_THROWS_AS(b.reorder({0, 1, 2, 3, 4}), invalid_permutation_error);
        CHECK(types_of(b) == "IHDR,tEXt,IDAT,IEND");
        CHECK(b.finalize() == data);
    }
}

TEST_CASE("Builder - index errors") {
    auto data = three_chunk_png();
    auto b = open_builder(data);

    CHECK_THROWS_AS(b.remove(3), index_out_of_range_error);
    CHECK_THROWS_AS(b.insert_before(3, "tEXt"_ct, {}), index_out_of_range_error);
    CHECK_THROWS_AS(b.insert_after(3, "tEXt"_ct, {}), index_out_of_range_error);
    CHECK_THROWS_AS(b.replace(3, "tEXt"_ct, {}), index_out_of_range_error);
    CHECK_THROWS_AS((void)b.type_at(3), index_out_of_range_error);
    CHECK_THROWS_AS((void)b.payload_at(99), index_out_of_range_error);

    b.remove(1);
    // The former index 2 is gone from the numbering
    CHECK_THROWS_AS(b.remove(2), index_out_of_range_error);
    CHECK_THROWS_AS(b.remove(2), builder_error);
    CHECK(b.size() == 2);
    CHECK(b.finalize() == minimal_png());
}

TEST_CASE("Builder - finalize") {
    SUBCASE("empty builder") {
        builder b;
        CHECK(b.empty());
        CHECK_THROWS_AS((void)b.finalize(), empty_output_error);
    }

    SUBCASE("everything removed") {
        auto data = minimal_png();
        auto b = open_builder(data);
        b.remove(0);
        b.remove(0);
        CHECK_THROWS_AS((void)b.finalize(), empty_output_error);
    }

    SUBCASE("built from scratch") {
        builder b;
        b.append("IHDR"_ct, ihdr_payload());
        b.append("IDAT"_ct, to_payload("abcd"));
        b.append("IEND"_ct, {});
        CHECK(b.finalize() == three_chunk_png());
    }

    SUBCASE("repeated calls give the same bytes") {
        auto data = three_chunk_png();
        auto b = open_builder(data);
        b.insert_after(1, "tEXt"_ct, to_payload("x"));
        auto first = b.finalize();
        auto second = b.finalize();
        CHECK(first == second);
        CHECK(first.data() != second.data());
    }

    SUBCASE("stale stored CRCs are recomputed") {
        auto data = signature_bytes();
        put_chunk(data, "IHDR", ihdr_payload(), 0x12345678u);
        put_chunk(data, "IEND", std::vector<std::byte>{});

        parse_options lenient;
        lenient.verify_checksums = false;
        reader r(data, lenient);
        auto b = builder::from_reader(r);
        CHECK(b.finalize() == minimal_png());
    }
}

TEST_CASE("Builder - structure validation") {
    auto data = three_chunk_png();

    SUBCASE("header must come first") {
        auto b = open_builder(data);
        b.reorder({1, 0, 2});
        CHECK_THROWS_AS((void)b.finalize(), missing_header_error);
    }

    SUBCASE("removing the header") {
        auto b = open_builder(data);
        b.remove(0);
        CHECK_THROWS_AS((void)b.finalize(), missing_header_error);
    }

    SUBCASE("terminator must come last") {
        auto b = open_builder(data);
        b.append("tEXt"_ct, to_payload("late"));
        CHECK_THROWS_AS((void)b.finalize(), missing_terminator_error);
    }

    SUBCASE("terminator must be empty") {
        auto b = open_builder(data);
        b.replace(2, "IEND"_ct, to_payload("x"));
        CHECK_THROWS_AS((void)b.finalize(), missing_terminator_error);
    }

    SUBCASE("a second terminator in the middle") {
        auto b = open_builder(data);
        b.insert_after(0, "IEND"_ct, {});
        CHECK_THROWS_AS((void)b.finalize(), trailing_data_error);
    }

    SUBCASE("validation can be turned off") {
        builder_options opts;
        opts.validate_structure = false;
        auto b = open_builder(data, opts);
        b.remove(0);
        auto out = b.finalize();
        CHECK(out.size() == signature_size + 12 + 4 + 12);

        // The reader refuses the result
        CHECK_THROWS_AS(validate(out), missing_header_error);
    }
}

TEST_CASE("Builder - failed calls change nothing") {
    auto data = three_chunk_png();
    auto b = open_builder(data);

    CHECK_THROWS_AS(b.insert_after(0, "t3Xt"_ct, to_payload("x")), invalid_type_tag_error);
    CHECK_THROWS_AS(b.replace(1, chunk_type("no"), {}), invalid_type_tag_error);
    CHECK_THROWS_AS(b.insert_before(5, "tEXt"_ct, {}), index_out_of_range_error);
    CHECK_THROWS_AS(b.reorder({2, 1}), invalid_permutation_error);

    CHECK(types_of(b) == "IHDR,IDAT,IEND");
    CHECK(b.log().entry_count() == 3);
    CHECK(b.finalize() == data);
}

TEST_CASE("Builder - chunks from several buffers") {
    auto base = minimal_png();
    auto donor = make_png({{"tEXt", "from donor"}, {"IDAT", "pixels"}});

    auto donor_chunks = reader(donor).collect_all();
    REQUIRE(donor_chunks.size() == 4);

    auto b = open_builder(base);
    b.insert_chunk_before(1, donor_chunks[2]);
    b.insert_chunk_before(1, donor_chunks[1]);
    CHECK(types_of(b) == "IHDR,tEXt,IDAT,IEND");
    CHECK(b.is_borrowed(1));
    CHECK(b.is_borrowed(2));

    CHECK(b.finalize() == donor);

    SUBCASE("two builders borrow from the same buffer") {
        auto other = builder::from_chunks(donor_chunks);
        other.remove(1);
        CHECK(other.finalize() == make_png({{"IDAT", "pixels"}}));
        CHECK(b.finalize() == donor);
    }
}
