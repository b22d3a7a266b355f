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

/// \file sov-batch.hpp
/// Score sets of reference and predicted sequences

#include "sov-io.hpp"

#include <exception>

namespace sov
{

struct sequence_pair
{
	std::string id;
	label_sequence reference;
	label_sequence prediction;
};

struct pair_result
{
	std::string id;
	std::size_t length = 0;

	double q3 = 0;
	double sov = 0;

	segment_overlap_statistics overlap;
	confusion_matrix residues;

	std::exception_ptr error;

	bool ok() const { return error == nullptr; }
	std::string error_message() const;
};

struct evaluation
{
	std::vector<pair_result> results;

	std::size_t scored = 0;

	// arithmetic means over the pairs that were scored
	std::optional<double> mean_q3, mean_sov;
};

/// \brief Match reference and prediction by id, in reference order.
///
/// Two sets each containing a single sequence are paired regardless of their ids.
std::vector<sequence_pair> pair_sequences(const sequence_set &reference, const sequence_set &prediction);

/// \brief Score a single pair, errors are stored in the result
pair_result evaluate_pair(const sequence_pair &pair);

/// \brief Score all \a pairs using \a nr_of_threads workers.
///
/// When \a skip_invalid is false the error of the first failing pair is
/// rethrown, otherwise failing pairs are left out of the means.
evaluation evaluate(const std::vector<sequence_pair> &pairs, std::size_t nr_of_threads, bool skip_invalid);

} // namespace sov
