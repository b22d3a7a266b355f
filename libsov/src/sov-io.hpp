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

#pragma once

/// \file sov-io.hpp
/// Reading label sequences from prediction and annotation files, and
/// writing label sequences and score reports.

#include "sov.hpp"

#include <cif++.hpp>

#include <filesystem>
#include <iosfwd>

namespace sov
{

struct evaluation;

struct labelled_sequence
{
	std::string id;
	label_sequence labels;
};

using sequence_set = std::vector<labelled_sequence>;

enum class input_format
{
	fasta,
	codes,
	ss2,
	dssp,
	mmcif
};

input_format parse_input_format(std::string_view name);

/// \brief Choose a format based on the extension of \a file, ignoring a trailing .gz
input_format guess_input_format(const std::filesystem::path &file);

/// \brief The identifier derived from a file name, i.e. the file name without extensions
std::string id_for_file(const std::filesystem::path &file);

/// Label FASTA, records with a '>id' header followed by lines of H, E and -
sequence_set read_label_fasta(std::istream &is);

/// FASTA-like records containing whitespace separated integer codes 0, 1 and 2
sequence_set read_label_codes(std::istream &is);

/// PSIPRED vertical format
labelled_sequence read_psipred_ss2(std::istream &is, const std::string &id);

/// Classic DSSP output, one sequence per chain
sequence_set read_dssp(std::istream &is, const std::string &id);

/// The dssp_struct_summary category written by DSSP in mmCIF files, one sequence per asym
sequence_set read_dssp_mmcif(const cif::datablock &db);

sequence_set read_sequences(const std::filesystem::path &file, input_format format);

inline sequence_set read_sequences(const std::filesystem::path &file)
{
	return read_sequences(file, guess_input_format(file));
}

void write_label_fasta(std::ostream &os, const sequence_set &sequences);

void write_report(std::ostream &os, const evaluation &eval, bool per_class);

} // namespace sov
