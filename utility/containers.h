// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include "common.h"
#include <boost/intrusive/list.hpp>

namespace xbridge {
namespace intrusive
{
	template <typename TEntry>
	struct list
		:public boost::intrusive::list<TEntry>
	{
		typedef boost::intrusive::list<TEntry> Base;

		void Delete(TEntry& x)
		{
			Base::erase(Base::s_iterator_to(x));
			delete& x;
		}

		void Clear()
		{
			while (!Base::empty())
				Delete(*Base::begin());
		}
	};

	template <typename TEntry>
	struct list_autoclear
		:public list<TEntry>
	{
		~list_autoclear() { list<TEntry>::Clear(); }
	};

} // namespace intrusive

	// Reversible modifications of an in-memory state. Each action knows how to revert itself,
	// reverting runs in the opposite order.
	template <typename TTarget>
	struct UndoLog
	{
		struct Action
			:public boost::intrusive::list_base_hook<>
		{
			virtual ~Action() = default;
			virtual void Undo(TTarget&) = 0;

			typedef intrusive::list_autoclear<Action> List;
		};

		typename Action::List m_lst;

		void Push(std::unique_ptr<Action>&& p)
		{
			m_lst.push_back(*p.release());
		}

		size_t get_Pos() const { return m_lst.size(); }

		void UndoTo(TTarget& t, size_t nTrg = 0)
		{
			while (m_lst.size() > nTrg)
			{
				auto& x = m_lst.back();
				x.Undo(t);
				m_lst.Delete(x);
			}
		}

		void Forget()
		{
			m_lst.Clear();
		}
	};

} // namespace xbridge
