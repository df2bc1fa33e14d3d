#include "swear/detector.hpp"
#include "swear/store.hpp"
#include "swear/subtitle.hpp"

#include <ribosome/dir.hpp>
#include <ribosome/error.hpp>
#include <ribosome/timer.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

#include <sys/stat.h>

#ifndef SWEAR_DATA_DIR
#define SWEAR_DATA_DIR "/usr/share/swear"
#endif

using namespace swear;

int main(int argc, char *argv[])
{
	namespace bpo = boost::program_options;

	std::vector<std::string> check;
	std::string data_dir;
	size_t cues;

	bpo::options_description generic("Language detector test options");
	generic.add_options()
		("help", "this help message")
		("data", bpo::value<std::string>(&data_dir)->default_value(SWEAR_DATA_DIR),
			"directory with per-language word and stop word lists")
		("check", bpo::value<std::vector<std::string>>(&check)->composing(),
		 	"files to check language, format: --check language:path, path is a file or a directory")
		("subtitle", "input files are subtitle (.srt) files")
		("cues", bpo::value<size_t>(&cues)->default_value(detector::default_cues),
			"number of subtitle cues used to detect language")
		("verbose", "print per-language scores of every file")
		;

	bpo::variables_map vm;
	bpo::options_description cmdline_options;
	cmdline_options.add(generic);

	try {
		bpo::store(bpo::command_line_parser(argc, argv).options(cmdline_options).run(), vm);

		if (vm.count("help")) {
			std::cout << cmdline_options << std::endl;
			return 0;
		}

		bpo::notify(vm);
	} catch (const std::exception &e) {
		std::cerr << "Invalid options: " << e.what() << "\n" << cmdline_options << std::endl;
		return -1;
	}

	if (check.empty()) {
		std::cerr << "There is nothing to check\n" << cmdline_options << std::endl;
		return -1;
	}

	bool want_subtitle = vm.count("subtitle") != 0;
	bool verbose = vm.count("verbose") != 0;

	auto prepare_dir = [] (const std::string &path) -> std::pair<std::string, std::string> {
		size_t sep_pos = path.find(':');
		if (sep_pos == std::string::npos) {
			std::cerr << path << ": could not find ':' separator, skipping" << std::endl;
			return std::make_pair<std::string, std::string>("", "");
		}

		std::string lang = path.substr(0, sep_pos);
		std::string dir = path.substr(sep_pos+1, path.size());

		return std::make_pair<std::string, std::string>(std::move(lang), std::move(dir));
	};

	store st(data_dir);
	detector det(st);

	long errors = 0;
	long failed = 0;
	long total = 0;

	ribosome::timer tm;

	auto check_file = [&] (const std::string &path, const std::string &lang) -> bool {
		ribosome::error_info err;
		std::string detected;

		if (want_subtitle) {
			err = det.detect_subtitle_file(path, cues, &detected);
		} else {
			std::ifstream in(path.c_str(), std::ios::binary);
			if (!in.is_open()) {
				err = ribosome::create_error(error::file_not_found, "could not open file %s", path.c_str());
			} else {
				std::ostringstream ss;
				ss << in.rdbuf();
				std::string text = ss.str();

				if (verbose) {
					std::vector<language_score> scores;
					if (!det.scores(text, &scores)) {
						std::cout << "detection: file: " << path << ", scores:";
						for (const auto &sc: scores) {
							std::cout << " " << sc.first << ": " << sc.second;
						}
						std::cout << std::endl;
					}
				}

				err = det.detect(text, &detected);
			}
		}

		total++;

		if (err) {
			// unsupported language means broken data directory, there is no point to go on
			if (err.code() == error::unsupported_language) {
				std::cerr << "detection: " << err.message() << std::endl;
				return false;
			}

			std::cout << "detection: file: " << path <<
				", failed: " << err.message() << " [" << err.code() << "]" << std::endl;
			failed++;
			errors++;
			return true;
		}

		if (detected != lang) {
			std::cout << "detection: file: " << path <<
				", expected: " << lang <<
				", language: " << detected << std::endl;
			errors++;
		} else {
			std::cout << "detection: file: " << path <<
				", successfully detected language: " << detected << std::endl;
		}

		return true;
	};

	for (auto &c: check) {
		auto p = prepare_dir(c);
		if (p.first.empty() || p.second.empty())
			continue;

		const auto &path = p.second;
		const auto &lang = p.first;

		if (!st.is_supported(lang)) {
			std::cerr << c << ": language '" << lang << "' is not supported, skipping" << std::endl;
			continue;
		}

		struct stat sb;
		if (stat(path.c_str(), &sb) < 0) {
			std::cerr << c << ": could not stat '" << path << "', skipping" << std::endl;
			continue;
		}

		if (!S_ISDIR(sb.st_mode)) {
			if (!check_file(path, lang))
				return error::unsupported_language;
			continue;
		}

		bool ok = true;
		ribosome::iterate_directory(path, [&](const char *fpath, const char *file) -> bool {
			(void) file;

			ok = check_file(fpath, lang);
			return ok;
		});

		if (!ok)
			return error::unsupported_language;
	}

	std::cout << "detection: files: " << total <<
		", errors: " << errors <<
		", failed: " << failed <<
		", error rate: " << (total ? (float)errors * 100.0/(float)total : 0.0) << "%" <<
		", time: " << tm.elapsed() << " ms" <<
		std::endl;

	return 0;
}
