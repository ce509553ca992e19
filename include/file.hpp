// SPDX-License-Identifier: MIT

#ifndef GBCONV_FILE_HPP
#define GBCONV_FILE_HPP

#include <fstream>
#include <ios>
#include <iostream>
#include <streambuf>
#include <string>

// An image, listing or tile data file; the path "-" stands for standard input or output
class File {
	std::filebuf _file;
	std::streambuf *_buf = nullptr;
	std::string _name;

public:
	// Returns false if the file cannot be opened, with `errno` telling why
	bool open(std::string const &path, std::ios_base::openmode mode) {
		bool output = mode & std::ios_base::out;
		if (path == "-") {
			_name = output ? "<stdout>" : "<stdin>";
			_buf = output ? std::cout.rdbuf() : std::cin.rdbuf();
		} else {
			_name = path;
			_buf = _file.open(path, mode) ? &_file : nullptr;
		}
		return _buf != nullptr;
	}

	// Flushes what is left to write; returns false if that fails
	bool close() {
		if (_buf == &_file) {
			return _file.close() != nullptr;
		}
		return _buf && _buf->pubsync() == 0;
	}

	std::streambuf &operator*() { return *_buf; }
	std::streambuf *operator->() { return _buf; }

	char const *name() const { return _name.c_str(); }
};

#endif // GBCONV_FILE_HPP
