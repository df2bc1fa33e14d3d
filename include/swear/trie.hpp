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

#ifndef __SWEAR_TRIE_HPP
#define __SWEAR_TRIE_HPP

#include <algorithm>
#include <string>
#include <vector>

namespace swear { namespace trie {

// edge of the trie: one whole word and the subtree it leads to
template <typename C>
class letter {
	public:
		letter(const std::string &l, const C &c) : m_letter(l), m_container(c) {}
		letter() {}

		const std::string &string() const {
			return m_letter;
		}

		C &data(void) {
			return m_container;
		}

		const C &data(void) const {
			return m_container;
		}

		bool operator< (const std::string &str) const {
			return m_letter < str;
		}

	private:
		std::string m_letter;
		C m_container;
};

// sorted array of edges, searched with binary search
template <typename L>
class layer {
	public:
		L *insert(const L &l) {
			auto it = std::lower_bound(m_layer.begin(), m_layer.end(), l.string());
			it = m_layer.insert(it, l);
			return &(*it);
		}

		L *find(const std::string &str) {
			auto it = std::lower_bound(m_layer.begin(), m_layer.end(), str);
			if (it == m_layer.end())
				return NULL;
			if (it->string() != str)
				return NULL;

			return &(*it);
		}

		const L *find(const std::string &str) const {
			auto it = std::lower_bound(m_layer.begin(), m_layer.end(), str);
			if (it == m_layer.end())
				return NULL;
			if (it->string() != str)
				return NULL;

			return &(*it);
		}

		size_t size(void) const {
			return m_layer.size();
		}

	private:
		std::vector<L> m_layer;
};

typedef std::vector<std::string> words;

template <typename D>
class node {
	public:
		node() : m_terminal(false) {}

		// returns false if exactly this word sequence has already been added,
		// data of the first insertion is kept in that case
		bool add(const words &ww, const D &d) {
			if (ww.empty())
				return false;

			return raw_add(ww, 0, d);
		}

		// exact lookup of the whole sequence, NULL if it is not a complete entry
		const D *lookup(const words &ww) const {
			const node<D> *n = this;
			for (const auto &w: ww) {
				n = n->next(w);
				if (!n)
					return NULL;
			}

			if (!n->terminal())
				return NULL;

			return &n->data();
		}

		const node<D> *next(const std::string &word) const {
			auto el = m_children.find(word);
			if (el == NULL)
				return NULL;

			return &el->data();
		}

		bool terminal() const {
			return m_terminal;
		}

		const D &data() const {
			return m_data;
		}

		size_t children() const {
			return m_children.size();
		}

	private:
		bool m_terminal;
		D m_data;
		layer<letter<node<D>>> m_children;

		bool raw_add(const words &ww, size_t pos, const D &d) {
			if (pos == ww.size()) {
				if (m_terminal)
					return false;

				m_terminal = true;
				m_data = d;
				return true;
			}

			const auto &w = ww[pos];

			auto el = m_children.find(w);
			if (el == NULL) {
				el = m_children.insert(letter<node<D>>(w, node<D>()));
			}

			return el->data().raw_add(ww, pos + 1, d);
		}
};

}} // namespace swear::trie

#endif /* __SWEAR_TRIE_HPP */
