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

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

/// \brief Bounded queue feeding a fixed set of worker threads.
///
/// Producers block while the queue holds N items. After close() has been
/// called pop() drains the remaining items and then returns an empty optional.
template <typename T, size_t N = 100>
class blocking_queue
{
  public:
	void push(T const &value)
	{
		std::unique_lock<std::mutex> lock(m_guard);

		while (m_queue.size() >= N and not m_closed)
			m_full_signal.wait(lock);

		if (m_closed)
			throw std::logic_error("push on a closed queue");

		m_queue.push(value);

		m_empty_signal.notify_one();
	}

	std::optional<T> pop()
	{
		std::unique_lock<std::mutex> lock(m_guard);
		while (m_queue.empty() and not m_closed)
			m_empty_signal.wait(lock);

		std::optional<T> result;

		if (not m_queue.empty())
		{
			result = m_queue.front();
			m_queue.pop();

			m_full_signal.notify_one();
		}

		return result;
	}

	void close()
	{
		std::unique_lock<std::mutex> lock(m_guard);
		m_closed = true;

		m_empty_signal.notify_all();
		m_full_signal.notify_all();
	}

  private:
	std::queue<T> m_queue;
	bool m_closed = false;
	std::mutex m_guard;
	std::condition_variable m_empty_signal, m_full_signal;
};
