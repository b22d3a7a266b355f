/*-
 * SPDX-License-Identifier: BSD-2-Clause
 *
 * Copyright (c) 2020 NKI/AVL, Netherlands Cancer Institute
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 * ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#if CATCH22
# include <catch2/catch.hpp>
#else
# include <catch2/catch_all.hpp>
#endif

#include "sov-batch.hpp"
#include "sov-io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

extern fs::path gTestDir;

using sov::structure_class;

// --------------------------------------------------------------------

cif::file operator""_cf(const char *text, size_t length)
{
	struct membuf : public std::streambuf
	{
		membuf(char *text, size_t length)
		{
			this->setg(text, text, text + length);
		}
	} buffer(const_cast<char *>(text), length);

	std::istream is(&buffer);
	return cif::file(is);
}

namespace
{

bool has_nested(const std::exception &e, const std::string &what)
{
	if (std::string{ e.what() }.find(what) != std::string::npos)
		return true;

	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception &nested)
	{
		return has_nested(nested, what);
	}

	return false;
}

} // namespace

// --------------------------------------------------------------------

TEST_CASE("input_format")
{
	CHECK(sov::guess_input_format("1abc.dssp") == sov::input_format::dssp);
	CHECK(sov::guess_input_format("data/1abc.dssp.gz") == sov::input_format::dssp);
	CHECK(sov::guess_input_format("1abc.cif") == sov::input_format::mmcif);
	CHECK(sov::guess_input_format("1abc.cif.gz") == sov::input_format::mmcif);
	CHECK(sov::guess_input_format("1abc.mmcif") == sov::input_format::mmcif);
	CHECK(sov::guess_input_format("1abc.ss2") == sov::input_format::ss2);
	CHECK(sov::guess_input_format("model.codes") == sov::input_format::codes);
	CHECK(sov::guess_input_format("predictions.fa") == sov::input_format::fasta);
	CHECK(sov::guess_input_format("predictions") == sov::input_format::fasta);

	CHECK(sov::parse_input_format("ss2") == sov::input_format::ss2);
	CHECK_THROWS_AS(sov::parse_input_format("xml"), std::runtime_error);

	CHECK(sov::id_for_file("/tmp/1abc.dssp.gz") == "1abc");
	CHECK(sov::id_for_file("1abc.ss2") == "1abc");
}

// --------------------------------------------------------------------

TEST_CASE("fasta_1")
{
	std::istringstream is(R"(>seq1 a description
HHHH----
EEEE

>seq2
H E -
; a comment
>seq3
)");

	auto s = sov::read_label_fasta(is);

	REQUIRE(s.size() == 3);
	CHECK(s[0].id == "seq1");
	CHECK(sov::to_string(s[0].labels) == "HHHH----EEEE");
	CHECK(s[1].id == "seq2");
	CHECK(sov::to_string(s[1].labels) == "HE-");
	CHECK(s[2].id == "seq3");
	CHECK(s[2].labels.empty());
}

TEST_CASE("fasta_invalid")
{
	std::istringstream is1(">seq1\nHHCC\n");

	try
	{
		sov::read_label_fasta(is1);
		FAIL("expected an exception");
	}
	catch (const std::exception &ex)
	{
		CHECK(has_nested(ex, "seq1"));
		CHECK(has_nested(ex, "Unknown structure label 'C'"));
	}

	std::istringstream is2("HHHH\n>seq1\nHH\n");
	CHECK_THROWS_AS(sov::read_label_fasta(is2), std::runtime_error);

	std::istringstream is3("> no id\nHH\n");
	CHECK_THROWS_AS(sov::read_label_fasta(is3), std::runtime_error);
}

TEST_CASE("fasta_write")
{
	sov::sequence_set s{
		{ "long", sov::parse_labels(std::string(70, 'H') + std::string(30, '-')) },
		{ "short", sov::parse_labels("EE") }
	};

	std::ostringstream os;
	sov::write_label_fasta(os, s);

	CHECK(os.str() == ">long\n" + std::string(60, 'H') + "\n" + std::string(10, 'H') + std::string(30, '-') + "\n>short\nEE\n");

	std::istringstream is(os.str());
	auto r = sov::read_label_fasta(is);

	REQUIRE(r.size() == 2);
	CHECK(r[0].labels == s[0].labels);
	CHECK(r[1].labels == s[1].labels);
}

TEST_CASE("codes_1")
{
	std::istringstream is(">model_1\n0 0 0 1\n1 2\t2\n>model_2\n2\n");

	auto s = sov::read_label_codes(is);

	REQUIRE(s.size() == 2);
	CHECK(sov::to_string(s[0].labels) == "HHHEE--");
	CHECK(sov::to_string(s[1].labels) == "-");

	std::istringstream is2(">model_1\n0 3\n");
	CHECK_THROWS_AS(sov::read_label_codes(is2), std::runtime_error);

	std::istringstream is3(">model_1\n0 1x\n");
	CHECK_THROWS_AS(sov::read_label_codes(is3), std::runtime_error);
}

// --------------------------------------------------------------------

TEST_CASE("ss2_1")
{
	auto s = sov::read_sequences(gTestDir / "1abc.ss2");

	REQUIRE(s.size() == 1);
	CHECK(s[0].id == "1abc");
	CHECK(sov::to_string(s[0].labels) == "-HHHH---EEE-");
}

TEST_CASE("ss2_invalid")
{
	std::istringstream is("# PSIPRED VFORMAT\n\n   1 M C   0.9 0.05 0.05\n   2 K X   0.9 0.05 0.05\n");
	CHECK_THROWS_AS(sov::read_psipred_ss2(is, "x"), std::runtime_error);

	std::istringstream is2("   1 M\n");
	CHECK_THROWS_AS(sov::read_psipred_ss2(is2, "x"), std::runtime_error);
}

TEST_CASE("dssp_1")
{
	auto s = sov::read_sequences(gTestDir / "1abc.dssp");

	REQUIRE(s.size() == 2);
	CHECK(s[0].id == "1abc_A");
	CHECK(sov::to_string(s[0].labels) == "-HHHHH--EEE-");
	CHECK(s[1].id == "1abc_B");
	CHECK(sov::to_string(s[1].labels) == "EEE-HH");
}

TEST_CASE("dssp_invalid")
{
	std::istringstream is("HEADER    NOT REALLY DSSP\n");
	CHECK_THROWS_AS(sov::read_dssp(is, "x"), std::runtime_error);

	std::istringstream is2("  #  RESIDUE AA STRUCTURE\n    1    1 A M\n");
	CHECK_THROWS_AS(sov::read_dssp(is2, "x"), std::runtime_error);
}

TEST_CASE("dssp_trailing_blank_lines")
{
	std::ifstream in(gTestDir / "1abc.dssp");
	REQUIRE(in.is_open());

	std::stringstream text;
	text << in.rdbuf() << "\n\n";

	auto s = sov::read_dssp(text, "1abc");

	REQUIRE(s.size() == 2);
	CHECK(sov::to_string(s[0].labels) == "-HHHHH--EEE-");
	CHECK(sov::to_string(s[1].labels) == "EEE-HH");
}

TEST_CASE("dssp_gz")
{
	auto s = sov::read_sequences(gTestDir / "1abc.dssp.gz");

	REQUIRE(s.size() == 2);
	CHECK(s[0].id == "1abc_A");
	CHECK(sov::to_string(s[0].labels) == "-HHHHH--EEE-");
	CHECK(s[1].id == "1abc_B");
	CHECK(sov::to_string(s[1].labels) == "EEE-HH");
}

TEST_CASE("mmcif_1")
{
	auto f = R"(data_1ABC
#
loop_
_dssp_struct_summary.entry_id
_dssp_struct_summary.label_comp_id
_dssp_struct_summary.label_asym_id
_dssp_struct_summary.label_seq_id
_dssp_struct_summary.secondary_structure
1ABC MET A 1 .
1ABC LYS A 2 H
1ABC VAL A 3 H
1ABC LEU A 4 G
1ABC ALA A 5 T
1ABC GLY B 1 E
1ABC THR B 2 B
1ABC ARG B 3 .
#
)"_cf;

	REQUIRE(not f.empty());

	auto s = sov::read_dssp_mmcif(f.front());

	REQUIRE(s.size() == 2);
	CHECK(s[0].id == "1ABC_A");
	CHECK(sov::to_string(s[0].labels) == "-HHH-");
	CHECK(s[1].id == "1ABC_B");
	CHECK(sov::to_string(s[1].labels) == "EE-");
}

TEST_CASE("mmcif_no_dssp")
{
	auto f = R"(data_1ABC
_entry.id 1ABC
)"_cf;

	REQUIRE(not f.empty());
	CHECK_THROWS_AS(sov::read_dssp_mmcif(f.front()), std::runtime_error);
}

TEST_CASE("mmcif_file")
{
	for (auto file : { "1abc.cif", "1abc-dssp.cif.gz" })
	{
		auto s = sov::read_sequences(gTestDir / file);

		REQUIRE(s.size() == 3);
		CHECK(s[0].id == "1ABC_A");
		CHECK(sov::to_string(s[0].labels) == "-HHHHH--EEE-");
		CHECK(s[1].id == "1ABC_B");
		CHECK(sov::to_string(s[1].labels) == "EEE-HH");
		CHECK(s[2].id == "2XYZ_A");
		CHECK(sov::to_string(s[2].labels) == "HH-");
	}

	// same labels as the classic DSSP output of this structure
	auto from_dssp = sov::read_sequences(gTestDir / "1abc.dssp");
	auto from_cif = sov::read_sequences(gTestDir / "1abc.cif", sov::input_format::mmcif);

	REQUIRE(from_dssp.size() == 2);
	CHECK(from_cif[0].labels == from_dssp[0].labels);
	CHECK(from_cif[1].labels == from_dssp[1].labels);
}

TEST_CASE("missing_file")
{
	CHECK_THROWS_AS(sov::read_sequences(gTestDir / "does-not-exist.fa"), std::runtime_error);
}

// --------------------------------------------------------------------

TEST_CASE("pairing_1")
{
	auto reference = sov::read_sequences(gTestDir / "1abc.dssp");
	auto prediction = sov::read_sequences(gTestDir / "1abc-pred.fa");

	REQUIRE(prediction.size() == 3);

	auto pairs = sov::pair_sequences(reference, prediction);

	REQUIRE(pairs.size() == 2);
	CHECK(pairs[0].id == "1abc_A");
	CHECK(sov::to_string(pairs[0].reference) == "-HHHHH--EEE-");
	CHECK(sov::to_string(pairs[0].prediction) == "-HHHH---EEEE");
	CHECK(pairs[1].id == "1abc_B");
	CHECK(sov::to_string(pairs[1].prediction) == "EEE---");
}

TEST_CASE("pairing_single")
{
	sov::sequence_set reference{ { "1abc_A", sov::parse_labels("-HHHHH--EEE-") } };
	auto prediction = sov::read_sequences(gTestDir / "1abc.ss2");

	auto pairs = sov::pair_sequences(reference, prediction);

	REQUIRE(pairs.size() == 1);
	CHECK(pairs[0].id == "1abc_A");
	CHECK(sov::to_string(pairs[0].prediction) == "-HHHH---EEE-");
}

TEST_CASE("pairing_duplicates")
{
	sov::sequence_set reference{ { "a", sov::parse_labels("HH") }, { "b", sov::parse_labels("EE") } };
	sov::sequence_set prediction{ { "a", sov::parse_labels("HH") }, { "a", sov::parse_labels("EE") } };

	CHECK_THROWS_AS(sov::pair_sequences(reference, prediction), std::runtime_error);
}

TEST_CASE("evaluate_1")
{
	auto reference = sov::read_sequences(gTestDir / "1abc.dssp");
	auto prediction = sov::read_sequences(gTestDir / "1abc-pred.fa");

	auto pairs = sov::pair_sequences(reference, prediction);

	for (std::size_t threads : { 1, 4 })
	{
		auto eval = sov::evaluate(pairs, threads, false);

		REQUIRE(eval.results.size() == 2);
		CHECK(eval.scored == 2);

		for (std::size_t i = 0; i < pairs.size(); ++i)
		{
			auto &r = eval.results[i];

			CHECK(r.ok());
			CHECK(r.id == pairs[i].id);
			CHECK(r.length == pairs[i].reference.size());
			CHECK(r.q3 == sov::residue_accuracy(pairs[i].reference, pairs[i].prediction));
			CHECK(r.sov == sov::segment_overlap_score(pairs[i].reference, pairs[i].prediction));
		}

		CHECK(eval.results[0].sov == 11.0 / 12);
		CHECK(eval.results[0].q3 == 10.0 / 12);
		CHECK(eval.results[1].sov == (3.0 + 1.0 / 3) / 6);
		CHECK(eval.results[1].q3 == 4.0 / 6);

		REQUIRE(eval.mean_sov.has_value());
		REQUIRE(eval.mean_q3.has_value());
		CHECK(*eval.mean_sov == (eval.results[0].sov + eval.results[1].sov) / 2);
		CHECK(*eval.mean_q3 == (eval.results[0].q3 + eval.results[1].q3) / 2);
	}
}

TEST_CASE("evaluate_invalid")
{
	std::vector<sov::sequence_pair> pairs{
		{ "good", sov::parse_labels("HHHH"), sov::parse_labels("HHEE") },
		{ "bad", sov::parse_labels("HHHHH"), sov::parse_labels("HHHH") },
		{ "empty", {}, {} }
	};

	CHECK_THROWS_AS(sov::evaluate(pairs, 2, false), sov::length_mismatch);

	auto eval = sov::evaluate(pairs, 2, true);

	REQUIRE(eval.results.size() == 3);
	CHECK(eval.scored == 1);

	CHECK(eval.results[0].ok());
	CHECK_FALSE(eval.results[1].ok());
	CHECK(eval.results[1].length == 5);
	CHECK(eval.results[1].error_message().find("differ in length") != std::string::npos);
	CHECK_FALSE(eval.results[2].ok());

	REQUIRE(eval.mean_sov.has_value());
	CHECK(*eval.mean_sov == 0.75);
	CHECK(*eval.mean_q3 == 0.5);

	std::ostringstream os;
	sov::write_report(os, eval, true);

	auto report = os.str();
	CHECK(report.find("skipped") != std::string::npos);
	CHECK(report.find("SOV_H") != std::string::npos);
	CHECK(report.find("sequences scored: 1 of 3") != std::string::npos);
	CHECK(report.find("mean SOV:  0.7500") != std::string::npos);
}

TEST_CASE("evaluate_many")
{
	std::vector<sov::sequence_pair> pairs;
	for (int i = 0; i < 200; ++i)
	{
		std::string ref(8 + i % 5, 'H');
		std::string pred = ref;
		pred[i % ref.length()] = 'E';
		pairs.push_back({ "s" + std::to_string(i), sov::parse_labels(ref), sov::parse_labels(pred) });
	}

	auto single = sov::evaluate(pairs, 1, false);
	auto multi = sov::evaluate(pairs, 16, false);

	REQUIRE(multi.results.size() == pairs.size());
	CHECK(multi.scored == pairs.size());

	for (std::size_t i = 0; i < pairs.size(); ++i)
	{
		CHECK(multi.results[i].id == pairs[i].id);
		CHECK(multi.results[i].sov == single.results[i].sov);
	}

	CHECK(*multi.mean_sov == *single.mean_sov);
	CHECK(*multi.mean_q3 == *single.mean_q3);
}

TEST_CASE("evaluate_nothing")
{
	auto eval = sov::evaluate({}, 4, false);

	CHECK(eval.results.empty());
	CHECK(eval.scored == 0);
	CHECK_FALSE(eval.mean_sov.has_value());
	CHECK_FALSE(eval.mean_q3.has_value());

	std::ostringstream os;
	sov::write_report(os, eval, false);
	CHECK(os.str().find("mean SOV:     n/a") != std::string::npos);
}
