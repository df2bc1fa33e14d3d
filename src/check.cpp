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

#include "swear/filter.hpp"

#include <boost/program_options.hpp>

#include <msgpack.hpp>

#include <ribosome/error.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

#ifndef SWEAR_DATA_DIR
#define SWEAR_DATA_DIR "/usr/share/swear"
#endif

using namespace swear;

static ribosome::error_info read_input(const std::string &path, std::string *ret)
{
	std::ifstream in(path.c_str(), std::ios::binary);
	if (!in.is_open()) {
		return ribosome::create_error(error::file_not_found, "could not open input file %s", path.c_str());
	}

	std::ostringstream ss;
	ss << in.rdbuf();
	if (in.bad()) {
		return ribosome::create_error(-EIO, "could not read input file %s", path.c_str());
	}

	*ret = ss.str();
	return ribosome::error_info();
}

int main(int argc, char *argv[])
{
	namespace bpo = boost::program_options;

	bpo::options_description generic("Profanity check options");

	std::string config, data_dir, language, subtitle, mask, format;
	size_t cues;
	std::vector<std::string> inputs;

	generic.add_options()
		("help", "This help message")
		("config", bpo::value<std::string>(&config), "Config file, command line options take precedence over it")
		("data", bpo::value<std::string>(&data_dir)->default_value(SWEAR_DATA_DIR),
		 	"Directory with per-language word lists: <data>/<language>/words.txt")
		("language", bpo::value<std::string>(&language)->default_value("en"), "Language of the text")
		("detect", "Detect language of every input text instead of using --language")
		("subtitle", bpo::value<std::string>(&subtitle), "Detect language from given subtitle (.srt) file")
		("cues", bpo::value<size_t>(&cues)->default_value(detector::default_cues),
		 	"Number of subtitle cues used to detect language")
		("censor", "Print censored text instead of found terms")
		("mask", bpo::value<std::string>(&mask)->default_value("*"), "Mask character used to censor text, must be punctuation")
		("format", bpo::value<std::string>(&format)->default_value("text"), "Output format: text or msgpack")
		("input", bpo::value<std::vector<std::string>>(&inputs)->composing(),
		 	"Files to check, if neither text nor files are given, standard input is checked")
		("verbose", "Print language scores and match statistics to stderr")
		;

	std::string text;

	bpo::options_description hidden("Positional options");
	hidden.add_options()
		("text", bpo::value<std::string>(&text), "text to check")
	;

	bpo::positional_options_description p;
	p.add("text", 1);

	bpo::variables_map vm;

	try {
		bpo::options_description cmdline_options;
		cmdline_options.add(generic).add(hidden);

		bpo::store(bpo::command_line_parser(argc, argv).options(cmdline_options).positional(p).run(), vm);

		if (vm.count("help")) {
			std::cout << generic << std::endl;
			return 0;
		}

		if (vm.count("config")) {
			const std::string &path = vm["config"].as<std::string>();
			std::ifstream conf(path.c_str());
			if (!conf.is_open()) {
				std::cerr << "Could not open config file " << path << std::endl;
				return -1;
			}

			bpo::store(bpo::parse_config_file(conf, generic), vm);
		}

		bpo::notify(vm);
	} catch (const std::exception &e) {
		std::cerr << "Invalid options: " << e.what() << "\n" << generic << std::endl;
		return -1;
	}

	if (format != "text" && format != "msgpack") {
		std::cerr << "Invalid output format '" << format << "', must be text or msgpack\n" << generic << std::endl;
		return -1;
	}

	lstring lmask = decode_utf8(mask);
	if (lmask.size() != 1) {
		std::cerr << "Mask must be exactly one character, got '" << mask << "'" << std::endl;
		return -1;
	}

	bool verbose = vm.count("verbose") != 0;
	bool detect = vm.count("detect") != 0;
	bool want_censor = vm.count("censor") != 0;

	store st(data_dir);
	filter flt(st);

	ribosome::error_info err = flt.set_mask(letter_code(lmask[0]));
	if (err) {
		std::cerr << "Invalid mask '" << mask << "': " << err.message() << std::endl;
		return err.code();
	}

	if (subtitle.size()) {
		std::string lang;
		err = flt.set_language_from_subtitle_file(subtitle, cues, &lang);
		if (err) {
			std::cerr << "Could not detect language from subtitle file " << subtitle << ": " << err.message() << std::endl;
			return err.code();
		}

		if (verbose)
			std::cerr << "subtitle: " << subtitle << ", detected language: " << lang << std::endl;
	} else if (!detect) {
		err = flt.set_language(language);
		if (err) {
			std::cerr << "Could not load language " << language << ": " << err.message() << std::endl;
			return err.code();
		}
	}

	std::vector<std::pair<std::string, std::string>> texts;
	if (vm.count("text")) {
		texts.emplace_back("text", text);
	}

	for (const auto &path: inputs) {
		std::string content;
		err = read_input(path, &content);
		if (err) {
			std::cerr << err.message() << std::endl;
			return err.code();
		}

		texts.emplace_back(path, content);
	}

	if (texts.empty()) {
		std::ostringstream ss;
		ss << std::cin.rdbuf();
		texts.emplace_back("stdin", ss.str());
	}

	for (const auto &t: texts) {
		const auto &name = t.first;
		const auto &content = t.second;

		if (detect && subtitle.empty()) {
			if (verbose) {
				std::vector<language_score> scores;
				err = flt.get_detector().scores(content, &scores);
				if (!err) {
					std::cerr << name << ": scores:";
					for (const auto &sc: scores) {
						std::cerr << " " << sc.first << ": " << sc.second;
					}
					std::cerr << std::endl;
				}
			}

			std::string lang;
			err = flt.set_language_from_text(content, &lang);
			if (err) {
				std::cerr << name << ": could not detect language: " << err.message() << std::endl;
				return err.code();
			}

			if (verbose)
				std::cerr << name << ": detected language: " << lang << std::endl;
		}

		if (want_censor) {
			std::string censored;
			err = flt.censor(content, &censored);
			if (err) {
				std::cerr << name << ": " << err.message() << std::endl;
				return err.code();
			}

			if (format == "msgpack") {
				msgpack::pack(std::cout, censored);
			} else {
				std::cout << censored;
				if (censored.empty() || censored[censored.size() - 1] != '\n')
					std::cout << std::endl;
			}

			continue;
		}

		std::vector<match_record> records;
		err = flt.check(content, &records);
		if (err) {
			std::cerr << name << ": " << err.message() << std::endl;
			return err.code();
		}

		if (verbose) {
			std::cerr << name << ": language: " << flt.language() <<
				", matches: " << records.size() << std::endl;
		}

		if (format == "msgpack") {
			msgpack::pack(std::cout, records);
			continue;
		}

		for (const auto &rec: records) {
			std::cout << name <<
				": term: " << rec.term <<
				", index: " << rec.index <<
				", start: " << rec.start <<
				", end: " << rec.end <<
				", text: " << rec.text <<
				std::endl;
		}
	}

	return 0;
}
