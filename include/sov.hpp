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

/// \file sov.hpp
/// Score 3-state secondary structure predictions against a reference
/// annotation: Q3 residue accuracy and the Segment Overlap (SOV) score.

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sov
{

// --------------------------------------------------------------------
// Labels

enum class structure_class : char
{
	Helix = 'H',
	Strand = 'E',
	Coil = '-'
};

/// The three classes, in the order they are scored and in code order
inline constexpr std::array<structure_class, 3> kStructureClasses{
	structure_class::Helix, structure_class::Strand, structure_class::Coil
};

using label_sequence = std::vector<structure_class>;

/// A label sequence still wrapped in the singleton outer dimension
/// that batched model output carries.
using batched_label_sequence = std::vector<label_sequence>;

// --------------------------------------------------------------------
// Errors

class error : public std::runtime_error
{
  public:
	using std::runtime_error::runtime_error;
};

class length_mismatch : public error
{
  public:
	length_mismatch(std::size_t reference_length, std::size_t prediction_length);

	std::size_t reference_length() const { return m_reference_length; }
	std::size_t prediction_length() const { return m_prediction_length; }

  private:
	std::size_t m_reference_length, m_prediction_length;
};

class empty_sequence : public error
{
  public:
	empty_sequence();
};

class unknown_label : public error
{
  public:
	explicit unknown_label(char symbol);
	explicit unknown_label(int code);
};

class batch_shape_error : public error
{
  public:
	explicit batch_shape_error(std::size_t outer_size);
};

// --------------------------------------------------------------------
// Conversions, H <-> 0, E <-> 1, - <-> 2

char to_symbol(structure_class label);
structure_class from_symbol(char symbol);

int to_code(structure_class label);
structure_class from_code(int code);

/// \brief Map a DSSP secondary structure code to its 3-state class.
///
/// H, G and I are helices, E and B strands and T, S, P and blank
/// (or '.' as written in mmCIF) are coil.
structure_class reduce_dssp(char dssp_code);

label_sequence parse_labels(std::string_view symbols);
std::string to_string(const label_sequence &labels);

label_sequence from_codes(const std::vector<int> &codes);
std::vector<int> to_codes(const label_sequence &labels);

/// \brief Remove the singleton outer dimension of a batched sequence,
/// throws batch_shape_error if the outer dimension is not exactly one.
label_sequence squeeze(const batched_label_sequence &batch);

// --------------------------------------------------------------------
// Segments

struct segment
{
	structure_class label;
	std::size_t begin;
	std::size_t length;

	std::size_t end() const { return begin + length; }

	/// The positions covered, in ascending order
	std::vector<std::size_t> positions() const;

	bool operator==(const segment &rhs) const
	{
		return label == rhs.label and begin == rhs.begin and length == rhs.length;
	}
};

class segment_group
{
  public:
	using segment_list = std::vector<segment>;

	const segment_list &operator[](structure_class label) const;
	segment_list &operator[](structure_class label);

	std::size_t size() const;
	bool empty() const { return size() == 0; }

  private:
	std::array<segment_list, 3> m_segments;
};

/// \brief Split \a sequence in maximal runs of identical labels.
///
/// The segments returned cover every position exactly once, per class
/// they are ordered from left to right.
segment_group extract_segments(const label_sequence &sequence);

// --------------------------------------------------------------------
// Scores

/// The contribution of a single overlapping reference/prediction segment pair
struct segment_pair_score
{
	std::size_t overlap = 0;
	std::size_t span = 0;
	std::size_t delta = 0;
	double value = 0;
};

/// \brief Score reference segment \a s1 against predicted segment \a s2,
/// returns an empty optional when they do not overlap.
std::optional<segment_pair_score> score_segment_pair(const segment &s1, const segment &s2);

struct segment_overlap_statistics
{
	struct class_tally
	{
		double value = 0;
		std::size_t length = 0;
	};

	std::array<class_tally, 3> per_class;

	const class_tally &operator[](structure_class label) const
	{
		return per_class[to_code(label)];
	}

	/// SOV over all classes
	double score() const;

	/// SOV for segments of class \a label only, empty if the reference has none
	std::optional<double> score(structure_class label) const;
};

segment_overlap_statistics segment_overlap(const label_sequence &reference, const label_sequence &prediction);

double segment_overlap_score(const label_sequence &reference, const label_sequence &prediction);

inline double segment_overlap_score(const batched_label_sequence &reference, const batched_label_sequence &prediction)
{
	return segment_overlap_score(squeeze(reference), squeeze(prediction));
}

/// \brief Q3, the fraction of positions with identical labels
double residue_accuracy(const label_sequence &reference, const label_sequence &prediction);

inline double residue_accuracy(const batched_label_sequence &reference, const batched_label_sequence &prediction)
{
	return residue_accuracy(squeeze(reference), squeeze(prediction));
}

inline double residue_accuracy(const batched_label_sequence &reference, const label_sequence &prediction)
{
	return residue_accuracy(squeeze(reference), prediction);
}

inline double residue_accuracy(const label_sequence &reference, const batched_label_sequence &prediction)
{
	return residue_accuracy(reference, squeeze(prediction));
}

/// Residue counts, indexed by reference class and predicted class
struct confusion_matrix
{
	std::array<std::array<std::size_t, 3>, 3> count{};

	std::size_t operator()(structure_class reference, structure_class prediction) const
	{
		return count[to_code(reference)][to_code(prediction)];
	}

	std::size_t total() const;
	std::size_t matches() const;

	/// Fraction of reference residues of class \a label predicted correctly,
	/// empty if the reference has none
	std::optional<double> accuracy(structure_class label) const;
};

confusion_matrix confusion(const label_sequence &reference, const label_sequence &prediction);

} // namespace sov
