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

// Segment extraction and the scores built on it

#include "sov.hpp"

#include <algorithm>
#include <numeric>

namespace sov
{

// --------------------------------------------------------------------

length_mismatch::length_mismatch(std::size_t reference_length, std::size_t prediction_length)
	: error("Reference and prediction differ in length (" + std::to_string(reference_length) + " vs " + std::to_string(prediction_length) + ")")
	, m_reference_length(reference_length)
	, m_prediction_length(prediction_length)
{
}

empty_sequence::empty_sequence()
	: error("Cannot score empty sequences")
{
}

unknown_label::unknown_label(char symbol)
	: error("Unknown structure label '" + std::string{ symbol } + "'")
{
}

unknown_label::unknown_label(int code)
	: error("Unknown structure code " + std::to_string(code))
{
}

batch_shape_error::batch_shape_error(std::size_t outer_size)
	: error("Expected a batch of exactly one sequence, got " + std::to_string(outer_size))
{
}

// --------------------------------------------------------------------

char to_symbol(structure_class label)
{
	switch (label)
	{
		case structure_class::Helix:
		case structure_class::Strand:
		case structure_class::Coil:
			return static_cast<char>(label);
		default:
			throw unknown_label(static_cast<char>(label));
	}
}

structure_class from_symbol(char symbol)
{
	switch (symbol)
	{
		case 'H': return structure_class::Helix;
		case 'E': return structure_class::Strand;
		case '-': return structure_class::Coil;
		default:
			throw unknown_label(symbol);
	}
}

int to_code(structure_class label)
{
	switch (label)
	{
		case structure_class::Helix: return 0;
		case structure_class::Strand: return 1;
		case structure_class::Coil: return 2;
		default:
			throw unknown_label(static_cast<char>(label));
	}
}

structure_class from_code(int code)
{
	if (code < 0 or code >= static_cast<int>(kStructureClasses.size()))
		throw unknown_label(code);

	return kStructureClasses[code];
}

structure_class reduce_dssp(char dssp_code)
{
	switch (dssp_code)
	{
		case 'H':
		case 'G':
		case 'I':
			return structure_class::Helix;

		case 'E':
		case 'B':
			return structure_class::Strand;

		case 'T':
		case 'S':
		case 'P':
		case ' ':
		case '.':
			return structure_class::Coil;

		default:
			throw unknown_label(dssp_code);
	}
}

label_sequence parse_labels(std::string_view symbols)
{
	label_sequence result;
	result.reserve(symbols.length());

	for (char ch : symbols)
		result.push_back(from_symbol(ch));

	return result;
}

std::string to_string(const label_sequence &labels)
{
	std::string result;
	result.reserve(labels.size());

	for (auto label : labels)
		result += to_symbol(label);

	return result;
}

label_sequence from_codes(const std::vector<int> &codes)
{
	label_sequence result;
	result.reserve(codes.size());

	for (int code : codes)
		result.push_back(from_code(code));

	return result;
}

std::vector<int> to_codes(const label_sequence &labels)
{
	std::vector<int> result;
	result.reserve(labels.size());

	for (auto label : labels)
		result.push_back(to_code(label));

	return result;
}

label_sequence squeeze(const batched_label_sequence &batch)
{
	if (batch.size() != 1)
		throw batch_shape_error(batch.size());

	return batch.front();
}

// --------------------------------------------------------------------

std::vector<std::size_t> segment::positions() const
{
	std::vector<std::size_t> result(length);
	std::iota(result.begin(), result.end(), begin);
	return result;
}

const segment_group::segment_list &segment_group::operator[](structure_class label) const
{
	return m_segments[to_code(label)];
}

segment_group::segment_list &segment_group::operator[](structure_class label)
{
	return m_segments[to_code(label)];
}

std::size_t segment_group::size() const
{
	std::size_t result = 0;
	for (auto &segments : m_segments)
		result += segments.size();
	return result;
}

segment_group extract_segments(const label_sequence &sequence)
{
	segment_group result;

	for (std::size_t i = 0; i < sequence.size();)
	{
		auto label = sequence[i];

		std::size_t j = i + 1;
		while (j < sequence.size() and sequence[j] == label)
			++j;

		result[label].push_back({ label, i, j - i });

		i = j;
	}

	return result;
}

// --------------------------------------------------------------------

namespace
{

void check_input(const label_sequence &reference, const label_sequence &prediction)
{
	if (reference.size() != prediction.size())
		throw length_mismatch(reference.size(), prediction.size());

	if (reference.empty())
		throw empty_sequence();
}

} // namespace

std::optional<segment_pair_score> score_segment_pair(const segment &s1, const segment &s2)
{
	if (s1.label != s2.label)
		return {};

	auto first = std::max(s1.begin, s2.begin);
	auto last = std::min(s1.end(), s2.end());

	if (first >= last)
		return {};

	segment_pair_score result;

	// both segments are contiguous and they intersect, so their union is contiguous as well
	result.overlap = last - first;
	result.span = s1.length + s2.length - result.overlap;
	result.delta = std::min({ result.span - result.overlap, result.overlap, s1.length / 2, s2.length / 2 });
	result.value = static_cast<double>(s1.length * (result.overlap + result.delta)) / result.span;

	return result;
}

double segment_overlap_statistics::score() const
{
	double value = 0;
	std::size_t length = 0;

	for (auto &tally : per_class)
	{
		value += tally.value;
		length += tally.length;
	}

	if (length == 0)
		throw empty_sequence();

	return value / length;
}

std::optional<double> segment_overlap_statistics::score(structure_class label) const
{
	auto &tally = per_class[to_code(label)];

	std::optional<double> result;
	if (tally.length > 0)
		result = tally.value / tally.length;
	return result;
}

segment_overlap_statistics segment_overlap(const label_sequence &reference, const label_sequence &prediction)
{
	check_input(reference, prediction);

	auto ref_groups = extract_segments(reference);
	auto pred_groups = extract_segments(prediction);

	segment_overlap_statistics result;

	for (auto label : kStructureClasses)
	{
		auto &tally = result.per_class[to_code(label)];

		for (auto &s1 : ref_groups[label])
		{
			// every reference segment counts, overlapping or not
			tally.length += s1.length;

			for (auto &s2 : pred_groups[label])
			{
				auto pair = score_segment_pair(s1, s2);
				if (pair)
					tally.value += pair->value;
			}
		}
	}

	return result;
}

double segment_overlap_score(const label_sequence &reference, const label_sequence &prediction)
{
	return segment_overlap(reference, prediction).score();
}

// --------------------------------------------------------------------

std::size_t confusion_matrix::total() const
{
	std::size_t result = 0;
	for (auto &row : count)
		result = std::accumulate(row.begin(), row.end(), result);
	return result;
}

std::size_t confusion_matrix::matches() const
{
	std::size_t result = 0;
	for (std::size_t i = 0; i < count.size(); ++i)
		result += count[i][i];
	return result;
}

std::optional<double> confusion_matrix::accuracy(structure_class label) const
{
	auto &row = count[to_code(label)];
	auto n = std::accumulate(row.begin(), row.end(), std::size_t{ 0 });

	std::optional<double> result;
	if (n > 0)
		result = static_cast<double>(row[to_code(label)]) / n;
	return result;
}

confusion_matrix confusion(const label_sequence &reference, const label_sequence &prediction)
{
	check_input(reference, prediction);

	confusion_matrix result;

	for (std::size_t i = 0; i < reference.size(); ++i)
		++result.count[to_code(reference[i])][to_code(prediction[i])];

	return result;
}

double residue_accuracy(const label_sequence &reference, const label_sequence &prediction)
{
	auto m = confusion(reference, prediction);
	return static_cast<double>(m.matches()) / m.total();
}

} // namespace sov
