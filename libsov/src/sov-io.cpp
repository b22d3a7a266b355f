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

#include "sov-io.hpp"
#include "sov-batch.hpp"

#include <cctype>
#include <charconv>
#include <iostream>
#include <map>
#include <ostream>

namespace fs = std::filesystem;

namespace sov
{

// --------------------------------------------------------------------

input_format parse_input_format(std::string_view name)
{
	if (name == "fasta")
		return input_format::fasta;
	if (name == "codes")
		return input_format::codes;
	if (name == "ss2")
		return input_format::ss2;
	if (name == "dssp")
		return input_format::dssp;
	if (name == "mmcif")
		return input_format::mmcif;

	throw std::runtime_error("Unknown input format '" + std::string{ name } + "', should be one of 'fasta', 'codes', 'ss2', 'dssp' or 'mmcif'");
}

input_format guess_input_format(const fs::path &file)
{
	fs::path p = file;
	if (p.extension() == ".gz")
		p = p.stem();

	auto ext = p.extension();

	if (ext == ".dssp")
		return input_format::dssp;
	if (ext == ".cif" or ext == ".mmcif")
		return input_format::mmcif;
	if (ext == ".ss2")
		return input_format::ss2;
	if (ext == ".codes")
		return input_format::codes;

	return input_format::fasta;
}

std::string id_for_file(const fs::path &file)
{
	fs::path p = file.filename();
	if (p.extension() == ".gz")
		p = p.stem();
	return p.stem().string();
}

// --------------------------------------------------------------------

namespace
{

void strip_cr(std::string &line)
{
	if (not line.empty() and line.back() == '\r')
		line.pop_back();
}

std::string parse_header(std::string_view line, int line_nr)
{
	auto header = line.substr(1);
	auto id = header.substr(0, header.find_first_of(" \t"));

	if (id.empty())
		throw std::runtime_error("Missing sequence id at line " + std::to_string(line_nr));

	return std::string{ id };
}

/// Read FASTA-like records, the sequence lines are passed to \a append
template <typename F>
sequence_set read_records(std::istream &is, F &&append)
{
	sequence_set result;

	std::string line;
	int line_nr = 0;

	while (std::getline(is, line))
	{
		++line_nr;
		strip_cr(line);

		if (line.empty() or line.front() == ';')
			continue;

		if (line.front() == '>')
		{
			result.push_back({ parse_header(line, line_nr), {} });
			continue;
		}

		if (result.empty())
			throw std::runtime_error("Sequence data before the first header at line " + std::to_string(line_nr));

		auto &seq = result.back();

		try
		{
			append(seq.labels, line);
		}
		catch (const std::exception &)
		{
			std::throw_with_nested(std::runtime_error("Invalid data for sequence " + seq.id + " at line " + std::to_string(line_nr)));
		}
	}

	return result;
}

} // namespace

sequence_set read_label_fasta(std::istream &is)
{
	return read_records(is, [](label_sequence &labels, const std::string &line)
		{
			for (char ch : line)
			{
				if (not std::isspace(static_cast<unsigned char>(ch)))
					labels.push_back(from_symbol(ch));
			} });
}

sequence_set read_label_codes(std::istream &is)
{
	return read_records(is, [](label_sequence &labels, const std::string &line)
		{
			for (auto token : cif::split(line, " \t", true))
			{
				int code;
				auto r = std::from_chars(token.data(), token.data() + token.length(), code);
				if (r.ec != std::errc() or r.ptr != token.data() + token.length())
					throw std::runtime_error("Invalid structure code '" + std::string{ token } + "'");

				labels.push_back(from_code(code));
			} });
}

// --------------------------------------------------------------------

namespace
{

structure_class psipred_class(char ss)
{
	switch (ss)
	{
		case 'H': return structure_class::Helix;
		case 'E': return structure_class::Strand;
		case 'C': return structure_class::Coil;
		default:
			throw unknown_label(ss);
	}
}

} // namespace

labelled_sequence read_psipred_ss2(std::istream &is, const std::string &id)
{
	labelled_sequence result{ id, {} };

	std::string line;
	int line_nr = 0;

	while (std::getline(is, line))
	{
		++line_nr;
		strip_cr(line);

		if (not line.empty() and line.front() == '#')
			continue;

		auto fld = cif::split(line, " \t", true);
		if (fld.empty())
			continue;

		if (fld.size() < 3 or fld[2].length() != 1)
			throw std::runtime_error("Invalid PSIPRED record at line " + std::to_string(line_nr));

		try
		{
			result.labels.push_back(psipred_class(fld[2].front()));
		}
		catch (const unknown_label &)
		{
			std::throw_with_nested(std::runtime_error("Invalid PSIPRED record at line " + std::to_string(line_nr)));
		}
	}

	return result;
}

// --------------------------------------------------------------------

sequence_set read_dssp(std::istream &is, const std::string &id)
{
	/*
	    The residue section starts after this header line:

	    #  RESIDUE AA STRUCTURE BP1 BP2  ACC     N-H-->O    O-->H-N    N-H-->O    O-->H-N    TCO  KAPPA ALPHA  PHI   PSI    X-CA   Y-CA   Z-CA

	    Chain ID is at offset 11, amino acid at 13 and the secondary structure at 16.
	    Break lines have a '!' in the amino acid column.
	 */

	const char kResidueHeader[] = "  #  RESIDUE";

	sequence_set result;
	std::map<char, std::size_t> chains;

	bool in_residues = false;

	std::string line;
	int line_nr = 0;

	while (std::getline(is, line))
	{
		++line_nr;
		strip_cr(line);

		if (not in_residues)
		{
			in_residues = line.compare(0, sizeof(kResidueHeader) - 1, kResidueHeader) == 0;
			continue;
		}

		if (line.empty())
			continue;

		if (line.length() < 17)
			throw std::runtime_error("Truncated DSSP residue line " + std::to_string(line_nr));

		if (line[13] == '!')
			continue;

		char chain = line[11];

		auto ci = chains.find(chain);
		if (ci == chains.end())
		{
			std::string chain_id = id;
			if (chain != ' ')
				chain_id = id.empty() ? std::string{ chain } : id + '_' + chain;

			ci = chains.emplace(chain, result.size()).first;
			result.push_back({ chain_id, {} });
		}

		try
		{
			result[ci->second].labels.push_back(reduce_dssp(line[16]));
		}
		catch (const unknown_label &)
		{
			std::throw_with_nested(std::runtime_error("Invalid DSSP residue line " + std::to_string(line_nr)));
		}
	}

	if (not in_residues)
		throw std::runtime_error("Not a DSSP file, the residue section is missing");

	return result;
}

sequence_set read_dssp_mmcif(const cif::datablock &db)
{
	auto dssp_struct_summary = db.get("dssp_struct_summary");
	if (dssp_struct_summary == nullptr)
		throw std::runtime_error("Datablock " + db.name() + " has no dssp_struct_summary category, was it annotated by DSSP?");

	sequence_set result;
	std::map<std::string, std::size_t> chains;

	for (const auto &[asym_id, ss] : dssp_struct_summary->rows<std::string, std::string>("label_asym_id", "secondary_structure"))
	{
		auto ci = chains.find(asym_id);
		if (ci == chains.end())
		{
			ci = chains.emplace(asym_id, result.size()).first;
			result.push_back({ db.name() + '_' + asym_id, {} });
		}

		// loops are written as inapplicable
		char code = '.';
		if (ss.length() > 1)
			throw std::runtime_error("Invalid secondary_structure value '" + ss + "' in asym " + asym_id);
		else if (ss.length() == 1 and ss != "?")
			code = ss.front();

		try
		{
			result[ci->second].labels.push_back(reduce_dssp(code));
		}
		catch (const unknown_label &)
		{
			std::throw_with_nested(std::runtime_error("Invalid dssp_struct_summary record for asym " + asym_id));
		}
	}

	return result;
}

// --------------------------------------------------------------------

sequence_set read_sequences(const fs::path &file, input_format format)
{
	cif::gzio::ifstream in(file);
	if (not in.is_open())
		throw std::runtime_error("Could not open file " + file.string());

	if (cif::VERBOSE > 0)
		std::cerr << "Reading " << file << std::endl;

	sequence_set result;

	try
	{
		switch (format)
		{
			case input_format::fasta:
				result = read_label_fasta(in);
				break;

			case input_format::codes:
				result = read_label_codes(in);
				break;

			case input_format::ss2:
				result.push_back(read_psipred_ss2(in, id_for_file(file)));
				break;

			case input_format::dssp:
				result = read_dssp(in, id_for_file(file));
				break;

			case input_format::mmcif:
			{
				cif::file f(in);
				for (auto &db : f)
				{
					auto s = read_dssp_mmcif(db);
					result.insert(result.end(), s.begin(), s.end());
				}
				break;
			}
		}
	}
	catch (const std::exception &)
	{
		std::throw_with_nested(std::runtime_error("Error reading " + file.string()));
	}

	if (cif::VERBOSE > 1)
	{
		for (auto &s : result)
			std::cerr << s.id << ": " << s.labels.size() << " residues" << std::endl;
	}

	return result;
}

// --------------------------------------------------------------------

void write_label_fasta(std::ostream &os, const sequence_set &sequences)
{
	const std::size_t kLineLength = 60;

	for (auto &s : sequences)
	{
		os << '>' << s.id << std::endl;

		auto symbols = to_string(s.labels);
		for (std::size_t i = 0; i < symbols.length(); i += kLineLength)
			os << symbols.substr(i, kLineLength) << std::endl;
	}
}

namespace
{

std::string format_optional(std::optional<double> v)
{
	return v.has_value() ? cif::format("%7.4f", *v).str() : "    n/a";
}

} // namespace

void write_report(std::ostream &os, const evaluation &eval, bool per_class)
{
	os << cif::format("%-20s %7s %7s %7s", "id", "length", "Q3", "SOV");
	if (per_class)
		os << cif::format(" %7s %7s %7s %7s %7s %7s", "Q_H", "Q_E", "Q_C", "SOV_H", "SOV_E", "SOV_C");
	os << std::endl;

	for (auto &r : eval.results)
	{
		os << cif::format("%-20s %7d", r.id, static_cast<int>(r.length));

		if (not r.ok())
		{
			os << "  skipped: " << r.error_message() << std::endl;
			continue;
		}

		os << cif::format(" %7.4f %7.4f", r.q3, r.sov);

		if (per_class)
		{
			for (auto label : kStructureClasses)
				os << ' ' << format_optional(r.residues.accuracy(label));
			for (auto label : kStructureClasses)
				os << ' ' << format_optional(r.overlap.score(label));
		}

		os << std::endl;
	}

	os << std::endl
	   << "sequences scored: " << eval.scored << " of " << eval.results.size() << std::endl
	   << "mean Q3:  " << format_optional(eval.mean_q3) << std::endl
	   << "mean SOV: " << format_optional(eval.mean_sov) << std::endl;
}

} // namespace sov
