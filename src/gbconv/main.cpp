// SPDX-License-Identifier: MIT

#include "gbconv/main.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <utility>

#include "cli.hpp"
#include "style.hpp"
#include "usage.hpp"
#include "verbosity.hpp"
#include "version.hpp"

#include "gbconv/listing.hpp"
#include "gbconv/paths.hpp"
#include "gbconv/process.hpp"
#include "gbconv/warning.hpp"

static char const *optstring = "EG:ghn:o:qTVvW:w";

static int longOpt; // `--color`

static option const longopts[] = {
    {"encode-only",  no_argument,       nullptr,  'E'},
    {"gbdk-file",    required_argument, nullptr,  'G'},
    {"gbdk",         no_argument,       nullptr,  'g'},
    {"help",         no_argument,       nullptr,  'h'},
    {"var",          required_argument, nullptr,  'n'},
    {"output",       required_argument, nullptr,  'o'},
    {"quiet",        no_argument,       nullptr,  'q'},
    {"no-timestamp", no_argument,       nullptr,  'T'},
    {"version",      no_argument,       nullptr,  'V'},
    {"verbose",      no_argument,       nullptr,  'v'},
    {"warning",      required_argument, nullptr,  'W'},
    {"color",        required_argument, &longOpt, 'c'},
    {nullptr,        no_argument,       nullptr,  0  },
};

static Usage const usage = {
    "gbconv",
    "[-EghqTVw] [-v [-v ...]] [-G <listing>] [-n <var_name>] [-o <tile_data>]\n"
    "              [-W <warning>] [--color <when>] <file.png> [<output.png>]",
    {
        {"-E, --encode-only",        "encode the input image as-is, without quantizing it"},
        {"-G, --gbdk-file <path>",   "write the GBDK listing to this path (implies -g)"    },
        {"-g, --gbdk",               "also generate a GBDK C source listing"              },
        {"-h, --help",               "print this help and exit"                           },
        {"-n, --var <name>",         "name of the generated array and constants"          },
        {"-o, --output <path>",      "output the raw 2bpp tile data to this path"         },
        {"-q, --quiet",              "do not print the conversion summary"                },
        {"-T, --no-timestamp",       "omit the generation date from the listing"          },
        {"-V, --version",            "print gbconv version and exit"                      },
        {"-v, --verbose",            "print more about the conversion; repeatable"        },
        {"-W, --warning <warning>",  "enable or disable warnings"                         },
        {"-w",                       "disable all warnings"                               },
        {"--color <auto|always|never>", "when to color the diagnostics"                   },
    },
};

static void parseArg(int ch, char *arg) {
	switch (ch) {
	case 'E':
		options.encodeOnly = true;
		break;

	case 'G':
		if (!options.listing.empty()) {
			warnx("Overriding listing file \"%s\"", options.listing.c_str());
		}
		options.listing = arg;
		options.gbdk = true; // Imply `-g`
		break;

	case 'g':
		options.gbdk = true;
		break;

	case 'h':
		usage.printAndExit(0);

	case 'n':
		if (arg[0] == '\0') {
			error("Variable name ('-n') cannot be empty");
		} else if (std::string name = sanitizeIdentifier(arg); name != arg) {
			warnx("Variable name \"%s\" will be used as \"%s\"", arg, name.c_str());
		}
		options.varName = arg;
		break;

	case 'o':
		if (!options.tileData.empty()) {
			warnx("Overriding tile data file \"%s\"", options.tileData.c_str());
		}
		options.tileData = arg;
		break;

	case 'q':
		options.quiet = true;
		break;

	case 'T':
		options.timestamp = false;
		break;

	case 'V':
		printf("%s %s\n", usage.name, get_package_version_string());
		exit(0);

	case 'v':
		incrementVerbosity();
		break;

	case 'W':
		warnings.processFlag(arg);
		break;

	case 'w':
		warnings.enabled = false;
		break;

	case 0: // Long-only options
		if (longOpt == 'c' && !style_Parse(arg)) {
			fatal("Invalid argument for option '--color'");
		}
		break;

	case 1: // Positional argument
		if (arg[0] == '\0') {
			usage.printAndExit("Image paths cannot be empty");
		} else if (options.input.empty()) {
			options.input = arg;
		} else if (options.output.empty()) {
			options.output = arg;
		} else {
			usage.printAndExit(
			    "Too many image paths! (input \"%s\", output \"%s\", then \"%s\")",
			    options.input.c_str(),
			    options.output.c_str(),
			    arg
			);
		}
		break;

	default:
		usage.printAndExit(1);
	}
}

static void verboseOutputConfig() {
	if (!checkVerbosity(VERB_CONFIG)) {
		return;
	}

	style_Set(stderr, STYLE_MAGENTA, false);
	fprintf(stderr, "%s %s\n", usage.name, get_package_version_string());
	fputs("Options:\n", stderr);
	if (options.encodeOnly) {
		fputs("\tEncode the input image without quantizing it\n", stderr);
	}
	if (options.gbdk) {
		fprintf(
		    stderr,
		    "\tGenerate a GBDK listing%s\n",
		    options.timestamp ? "" : ", without generation date"
		);
	}
	if (!options.varName.empty()) {
		fprintf(stderr, "\tVariable name: %s\n", options.varName.c_str());
	}
	for (auto const &[name, path] : {
	         std::pair{"Input image",      &options.input   },
	         std::pair{"Output image",     &options.output  },
	         std::pair{"Output listing",   &options.listing },
	         std::pair{"Output tile data", &options.tileData},
	     }) {
		if (!path->empty()) {
			fprintf(stderr, "\t%s: %s\n", name, path->c_str());
		}
	}
	fputs("Ready.\n", stderr);
	style_Reset(stderr);
}

int main(int argc, char *argv[]) {
	cli_ParseArgs(argc, argv, optstring, longopts, parseArg, usage);

	if (options.input.empty()) {
		usage.printAndExit("No input image specified");
	}
	if (options.encodeOnly) {
		if (!options.output.empty()) {
			warnx(
			    "Encoding only ('-E'), so no image will be written to \"%s\"",
			    options.output.c_str()
			);
		}
		if (!options.gbdk && options.tileData.empty()) {
			warnx("Encoding only ('-E'), but neither a listing ('-g') nor tile data ('-o') "
			      "was requested");
		}
	}
	deriveOutputPaths(options);

	verboseOutputConfig();

	// Do not do anything if option parsing went wrong
	requireZeroErrors();

	process();
	return 0;
}
