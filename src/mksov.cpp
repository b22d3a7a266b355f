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

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include <mcfp/mcfp.hpp>
#include <cif++.hpp>

#include "sov.hpp"

#include "sov-batch.hpp"
#include "sov-io.hpp"
#include "revision.hpp"

namespace fs = std::filesystem;

// --------------------------------------------------------------------

// recursively print exception whats:
void print_what(const std::exception &e)
{
	std::cerr << e.what() << std::endl;
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception &nested)
	{
		std::cerr << " >> ";
		print_what(nested);
	}
}

// --------------------------------------------------------------------

sov::input_format format_for(const mcfp::config &config, const std::string &option, const fs::path &file)
{
	if (config.has(option))
		return sov::parse_input_format(config.get<std::string>(option));
	return sov::guess_input_format(file);
}

void write_output(std::ostream &os, const fs::path &reference, const fs::path &prediction, const sov::evaluation &eval, bool per_class)
{
	os << "# " << kProjectName << " version " << kVersionNumber << std::endl
	   << "# reference:  " << reference.string() << std::endl
	   << "# prediction: " << prediction.string() << std::endl;

	sov::write_report(os, eval, per_class);
}

int s_main(int argc, const char *argv[])
{
	auto &config = mcfp::config::instance();

	config.init("Usage: mksov [options] reference-file prediction-file [output-file]",
		mcfp::make_option<std::string>("reference-format", "Format of the reference file, one of 'fasta', 'codes', 'ss2', 'dssp' or 'mmcif'. The default is chosen based on the extension of the file."),
		mcfp::make_option<std::string>("prediction-format", "Format of the prediction file, see reference-format"),
		mcfp::make_option<unsigned>("threads,t", std::thread::hardware_concurrency(), "Number of threads to use for scoring"),
		mcfp::make_option("skip-invalid", "If set, sequences that cannot be scored are reported and left out of the means instead of aborting"),
		mcfp::make_option("per-class", "If set, also report Q and SOV per structure class"),
		mcfp::make_option("write-labels", "Write the 3-state labels of the reference file in FASTA format instead of scoring"),

		mcfp::make_option<std::string>("config", "Configuration file to use, default is mksov.conf in the current directory or /etc"),

		mcfp::make_option("help,h", "Display help message"),
		mcfp::make_option("version", "Print version"),
		mcfp::make_option("verbose,v", "verbose output"),
		mcfp::make_option("quiet", "Reduce verbose output to a minimum"),

		mcfp::make_hidden_option<int>("debug,d", "Debug level (for even more verbose output)"));

	config.parse(argc, argv);

	config.parse_config_file("config", "mksov.conf", { fs::current_path().string(), "/etc" });

	// --------------------------------------------------------------------

	if (config.has("version"))
	{
		write_version_string(std::cout, config.has("verbose"));
		exit(0);
	}

	if (config.has("help"))
	{
		std::cerr << config << std::endl;
		exit(0);
	}

	if (config.operands().empty())
	{
		std::cerr << "Reference file not specified" << std::endl;
		exit(1);
	}

	if (config.count("quiet"))
		cif::VERBOSE = -1;
	else
		cif::VERBOSE = config.count("verbose");

	if (config.has("debug"))
		cif::VERBOSE = config.get<int>("debug");

	// --------------------------------------------------------------------

	fs::path reference_file = config.operands()[0];
	auto reference = sov::read_sequences(reference_file, format_for(config, "reference-format", reference_file));

	if (config.has("write-labels"))
	{
		if (config.operands().size() > 1)
		{
			cif::gzio::ofstream out(config.operands()[1]);
			if (not out.is_open())
			{
				std::cerr << "Could not open output file" << std::endl;
				exit(1);
			}

			sov::write_label_fasta(out, reference);
		}
		else
			sov::write_label_fasta(std::cout, reference);

		return 0;
	}

	if (config.operands().size() < 2)
	{
		std::cerr << "Prediction file not specified" << std::endl;
		exit(1);
	}

	fs::path prediction_file = config.operands()[1];
	auto prediction = sov::read_sequences(prediction_file, format_for(config, "prediction-format", prediction_file));

	auto pairs = sov::pair_sequences(reference, prediction);
	if (pairs.empty())
	{
		std::cerr << "No matching sequences found in reference and prediction files" << std::endl;
		exit(1);
	}

	auto eval = sov::evaluate(pairs, config.get<unsigned>("threads"), config.has("skip-invalid"));

	bool per_class = config.has("per-class");

	if (config.operands().size() > 2)
	{
		fs::path output = config.operands()[2];

		cif::gzio::ofstream out(output);
		if (not out.is_open())
		{
			std::cerr << "Could not open output file" << std::endl;
			exit(1);
		}

		write_output(out, reference_file, prediction_file, eval, per_class);
	}
	else
		write_output(std::cout, reference_file, prediction_file, eval, per_class);

	return eval.scored > 0 ? 0 : 1;
}

// --------------------------------------------------------------------

int main(int argc, const char *argv[])
{
	int result = 0;

	try
	{
		result = s_main(argc, argv);
	}
	catch (const std::exception &ex)
	{
		print_what(ex);
		exit(1);
	}

	return result;
}
