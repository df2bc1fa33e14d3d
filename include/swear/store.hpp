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

#ifndef __SWEAR_STORE_HPP
#define __SWEAR_STORE_HPP

#include "swear/error.hpp"
#include "swear/vocabulary.hpp"

#include <ribosome/error.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace swear {

typedef std::shared_ptr<const vocabulary> vocabulary_t;

/*
 * Per-language word lists, loaded from @data_dir/<language>/ on first request
 * and cached for the lifetime of the store. Loaded vocabularies are never
 * modified, so they can be shared between sessions and threads.
 */
class store {
public:
	struct options {
		std::string words_file;
		std::string stopwords_file;

		// supported languages, order is the priority used to break detection ties
		std::vector<std::string> languages;

		options():
			words_file("words.txt"),
			stopwords_file("stopwords.txt"),
			languages({"en", "tr", "de", "es", "pt"})
		{
		}
	};

	store(const std::string &data_dir) : m_data_dir(data_dir) {}
	store(const std::string &data_dir, const store::options &opts) : m_data_dir(data_dir), m_opts(opts) {}

	const std::string &data_dir() const {
		return m_data_dir;
	}

	// copy, the list grows when unknown languages are inserted
	std::vector<std::string> supported() const {
		std::lock_guard<std::mutex> guard(m_lock);
		return m_opts.languages;
	}

	bool is_supported(const std::string &lang) const {
		std::lock_guard<std::mutex> guard(m_lock);
		return listed(lang);
	}

	ribosome::error_info load(const std::string &lang, vocabulary_t *ret) {
		if (!is_supported(lang)) {
			return ribosome::create_error(error::unsupported_language, "language '%s' is not supported",
					lang.c_str());
		}

		std::unique_lock<std::mutex> guard(m_lock);
		auto it = m_cache.find(lang);
		if (it != m_cache.end()) {
			*ret = it->second;
			return ribosome::error_info();
		}
		guard.unlock();

		std::shared_ptr<vocabulary> voc = std::make_shared<vocabulary>(lang);

		std::string dir = m_data_dir + "/" + lang + "/";

		std::string words_path = dir + m_opts.words_file;
		bool found = false;
		auto err = read_lines(words_path, &found, [&] (const std::string &line) {
			voc->add_term(line);
		});
		if (err)
			return err;
		if (!found) {
			return ribosome::create_error(error::unsupported_language, "there is no word list for language '%s': %s",
					lang.c_str(), words_path.c_str());
		}

		std::string stopwords_path = dir + m_opts.stopwords_file;
		err = read_lines(stopwords_path, &found, [&] (const std::string &line) {
			voc->add_reference(line);
		});
		if (err)
			return err;

		guard.lock();
		// somebody could have loaded the same language while we were reading files
		auto p = m_cache.insert(std::make_pair(lang, vocabulary_t(voc)));
		*ret = p.first->second;

		return ribosome::error_info();
	}

	// puts already built vocabulary into the cache, replacing previous one
	void insert(const vocabulary_t &voc) {
		std::lock_guard<std::mutex> guard(m_lock);
		m_cache[voc->language()] = voc;

		if (!listed(voc->language()))
			m_opts.languages.push_back(voc->language());
	}

private:
	std::string m_data_dir;
	struct options m_opts;

	mutable std::mutex m_lock;
	std::map<std::string, vocabulary_t> m_cache;

	bool listed(const std::string &lang) const {
		return std::find(m_opts.languages.begin(), m_opts.languages.end(), lang) != m_opts.languages.end();
	}

	// missing file is not an error here, @found tells caller whether it exists
	ribosome::error_info read_lines(const std::string &path, bool *found,
			const std::function<void (const std::string &)> &callback) {
		std::ifstream in(path.c_str());
		if (!in.is_open()) {
			*found = false;
			return ribosome::error_info();
		}

		*found = true;

		std::string line;
		bool first = true;
		while (std::getline(in, line)) {
			if (first && line.compare(0, 3, "\xef\xbb\xbf") == 0)
				line.erase(0, 3);
			first = false;

			boost::algorithm::trim(line);
			if (line.empty() || line[0] == '#')
				continue;

			callback(line);
		}

		if (in.bad()) {
			return ribosome::create_error(-EIO, "could not read word list %s", path.c_str());
		}

		return ribosome::error_info();
	}
};

} // namespace swear

#endif /* __SWEAR_STORE_HPP */
