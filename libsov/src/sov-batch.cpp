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

#include "sov-batch.hpp"
#include "queue.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace sov
{

// --------------------------------------------------------------------

std::string pair_result::error_message() const
{
	std::string result;

	if (error)
	{
		try
		{
			std::rethrow_exception(error);
		}
		catch (const std::exception &ex)
		{
			result = ex.what();
		}
	}

	return result;
}

// --------------------------------------------------------------------

std::vector<sequence_pair> pair_sequences(const sequence_set &reference, const sequence_set &prediction)
{
	std::vector<sequence_pair> result;

	if (reference.size() == 1 and prediction.size() == 1)
	{
		auto &r = reference.front();
		auto &p = prediction.front();

		if (r.id != p.id and cif::VERBOSE > 0)
			std::cerr << "Pairing reference " << r.id << " with prediction " << p.id << std::endl;

		result.push_back({ r.id, r.labels, p.labels });
		return result;
	}

	std::map<std::string, const labelled_sequence *> index;
	for (auto &p : prediction)
	{
		if (not index.emplace(p.id, &p).second)
			throw std::runtime_error("Duplicate prediction id " + p.id);
	}

	std::set<std::string> used;

	for (auto &r : reference)
	{
		auto i = index.find(r.id);
		if (i == index.end())
		{
			if (cif::VERBOSE > 0)
				std::cerr << "No prediction for reference " << r.id << std::endl;
			continue;
		}

		result.push_back({ r.id, r.labels, i->second->labels });
		used.insert(r.id);
	}

	if (cif::VERBOSE > 0)
	{
		for (auto &p : prediction)
		{
			if (used.count(p.id) == 0)
				std::cerr << "No reference for prediction " << p.id << std::endl;
		}
	}

	return result;
}

// --------------------------------------------------------------------

pair_result evaluate_pair(const sequence_pair &pair)
{
	pair_result result;

	result.id = pair.id;
	result.length = pair.reference.size();

	try
	{
		result.residues = confusion(pair.reference, pair.prediction);
		result.q3 = static_cast<double>(result.residues.matches()) / result.residues.total();

		result.overlap = segment_overlap(pair.reference, pair.prediction);
		result.sov = result.overlap.score();
	}
	catch (...)
	{
		result.error = std::current_exception();
	}

	return result;
}

evaluation evaluate(const std::vector<sequence_pair> &pairs, std::size_t nr_of_threads, bool skip_invalid)
{
	evaluation result;
	result.results.resize(pairs.size());

	if (nr_of_threads == 0)
		nr_of_threads = 1;
	if (nr_of_threads > pairs.size())
		nr_of_threads = std::max<std::size_t>(pairs.size(), 1);

	std::unique_ptr<cif::progress_bar> progress;
	if (cif::VERBOSE == 0 or cif::VERBOSE == 1)
		progress.reset(new cif::progress_bar(pairs.size(), "scoring"));
	std::mutex progress_guard;

	blocking_queue<std::size_t> q;

	std::vector<std::thread> workers;

	try
	{
		for (std::size_t i = 0; i < nr_of_threads; ++i)
		{
			workers.emplace_back([&]()
				{
					for (;;)
					{
						auto ix = q.pop();
						if (not ix)
							break;

						result.results[*ix] = evaluate_pair(pairs[*ix]);

						if (progress)
						{
							std::unique_lock<std::mutex> lock(progress_guard);
							progress->consumed(1);
						}
					} });
		}
	}
	catch (const std::exception &)
	{
		// could not start all workers, stop the ones that are running
		q.close();
		for (auto &t : workers)
			t.join();
		throw;
	}

	for (std::size_t i = 0; i < pairs.size(); ++i)
		q.push(i);
	q.close();

	for (auto &t : workers)
		t.join();

	progress.reset(nullptr);

	// means in pair order, independent of scheduling

	double sum_q3 = 0, sum_sov = 0;

	for (auto &r : result.results)
	{
		if (r.ok())
		{
			sum_q3 += r.q3;
			sum_sov += r.sov;
			++result.scored;
			continue;
		}

		if (not skip_invalid)
			std::rethrow_exception(r.error);

		if (cif::VERBOSE > 0)
			std::cerr << "Skipping " << r.id << ": " << r.error_message() << std::endl;
	}

	if (result.scored > 0)
	{
		result.mean_q3 = sum_q3 / result.scored;
		result.mean_sov = sum_sov / result.scored;
	}

	return result;
}

} // namespace sov
