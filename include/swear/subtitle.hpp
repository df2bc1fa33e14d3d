/*
 * Copyright 2013+ Evgeniy Polyakov <zbr@ioremap.net>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __SWEAR_SUBTITLE_HPP
#define __SWEAR_SUBTITLE_HPP

#include "swear/error.hpp"

#include <ribosome/error.hpp>

#include <boost/algorithm/string.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace swear {

struct cue {
	int		index = 0;
	long		start_ms = 0;
	long		end_ms = 0;
	std::string	text;		// markup removed, lines joined with a space
};

// SubRip (.srt) reader
class subtitle {
public:
	ribosome::error_info parse_file(const std::string &path) {
		std::ifstream in(path.c_str(), std::ios::binary);
		if (!in.is_open()) {
			return ribosome::create_error(error::file_not_found, "could not open subtitle file %s", path.c_str());
		}

		std::ostringstream ss;
		ss << in.rdbuf();
		if (in.bad()) {
			return ribosome::create_error(-EIO, "could not read subtitle file %s", path.c_str());
		}

		return parse(ss.str(), path);
	}

	// @name is only used in error messages
	ribosome::error_info parse(const std::string &content, const std::string &name) {
		m_cues.clear();

		std::istringstream in(content);
		std::string line;
		int line_num = 0;

		cue current;
		enum { wait_block, wait_timing, read_text } state = wait_block;
		int block_line = 0;

		auto flush = [&] () {
			if (state == read_text) {
				m_cues.emplace_back(std::move(current));
			}
			current = cue();
			state = wait_block;
		};

		while (std::getline(in, line)) {
			++line_num;

			if (line_num == 1 && line.compare(0, 3, "\xef\xbb\xbf") == 0)
				line.erase(0, 3);

			boost::algorithm::trim_right(line);

			if (line.empty()) {
				if (state == wait_timing) {
					return ribosome::create_error(error::parse_error, "%s: %d: block has no timing line",
							name.c_str(), block_line);
				}

				flush();
				continue;
			}

			switch (state) {
			case wait_block:
				block_line = line_num;
				if (parse_timing(line, &current)) {
					current.index = m_cues.size() + 1;
					state = read_text;
					break;
				}

				if (!parse_index(line, &current.index)) {
					return ribosome::create_error(error::parse_error, "%s: %d: expected cue number or timing, got '%s'",
							name.c_str(), line_num, line.c_str());
				}
				state = wait_timing;
				break;
			case wait_timing:
				if (!parse_timing(line, &current)) {
					return ribosome::create_error(error::parse_error, "%s: %d: invalid timing line '%s'",
							name.c_str(), line_num, line.c_str());
				}
				state = read_text;
				break;
			case read_text: {
				std::string text = strip_markup(line);
				boost::algorithm::trim(text);
				if (text.empty())
					break;

				if (!current.text.empty())
					current.text += " ";
				current.text += text;
				break;
			}
			}
		}

		if (state == wait_timing) {
			return ribosome::create_error(error::parse_error, "%s: %d: block has no timing line",
					name.c_str(), block_line);
		}
		flush();

		return ribosome::error_info();
	}

	const std::vector<cue> &cues() const {
		return m_cues;
	}

	// text of the first @num cues joined with a space, cues without text are skipped
	std::string sample(size_t num) const {
		std::string ret;

		for (size_t i = 0; i < m_cues.size() && i < num; ++i) {
			if (m_cues[i].text.empty())
				continue;

			if (!ret.empty())
				ret += " ";
			ret += m_cues[i].text;
		}

		return ret;
	}

	// removes <tag> and {override} blocks, unterminated ones are left as is
	static std::string strip_markup(const std::string &line) {
		std::string ret;
		ret.reserve(line.size());

		for (size_t pos = 0; pos < line.size(); ++pos) {
			char ch = line[pos];
			if (ch == '<' || ch == '{') {
				size_t close = line.find(ch == '<' ? '>' : '}', pos + 1);
				if (close != std::string::npos) {
					pos = close;
					continue;
				}
			}

			ret.push_back(ch);
		}

		return ret;
	}

private:
	std::vector<cue> m_cues;

	static bool parse_index(const std::string &line, int *index) {
		if (line.empty() || line.size() > 9)
			return false;

		for (auto ch: line) {
			if (ch < '0' || ch > '9')
				return false;
		}

		*index = atoi(line.c_str());
		return true;
	}

	// 00:01:02,345 --> 00:01:04,000, dot is accepted instead of comma
	static bool parse_timing(const std::string &line, cue *c) {
		int h1, m1, s1, ms1, h2, m2, s2, ms2;
		char sep1, sep2;

		int num = sscanf(line.c_str(), "%d:%d:%d%c%d --> %d:%d:%d%c%d",
				&h1, &m1, &s1, &sep1, &ms1, &h2, &m2, &s2, &sep2, &ms2);
		if (num != 10)
			return false;

		if ((sep1 != ',' && sep1 != '.') || (sep2 != ',' && sep2 != '.'))
			return false;

		if (m1 > 59 || s1 > 59 || m2 > 59 || s2 > 59 || ms1 > 999 || ms2 > 999)
			return false;
		if (h1 < 0 || m1 < 0 || s1 < 0 || ms1 < 0 || h2 < 0 || m2 < 0 || s2 < 0 || ms2 < 0)
			return false;

		c->start_ms = ((h1 * 60L + m1) * 60L + s1) * 1000L + ms1;
		c->end_ms = ((h2 * 60L + m2) * 60L + s2) * 1000L + ms2;
		return true;
	}
};

} // namespace swear

#endif /* __SWEAR_SUBTITLE_HPP */
