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

#include "string_helpers.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace xbridge::string_helpers
{
	std::vector<std::string> split(const std::string& s, char delim, bool trimSpaces)
	{
		std::vector<std::string> res;
		if (!s.empty())
		{
			boost::algorithm::split(res, s, boost::algorithm::is_from_range(delim, delim), boost::algorithm::token_compress_off);

			if (trimSpaces)
				for (auto& x : res)
					boost::algorithm::trim(x);
		}

		return res;
	}
}
