// SPDX-License-Identifier: MIT

#ifndef GBCONV_PROCESS_HPP
#define GBCONV_PROCESS_HPP

// Converts the input image per the global options, writing every requested output
void process();

#endif // GBCONV_PROCESS_HPP
