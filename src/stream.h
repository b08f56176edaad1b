#ifndef STREAM_H

#define STREAM_H

#include <string>
#include <string_view>

struct stream {
	std::string name;
	std::string url;
};

// Keeps only ASCII alphanumerics, '_' and '-' so that a stream name can be used as part
// of a file name. Returns "unnamed" when nothing is left.
std::string sanitize_name(const std::string_view& name);

#endif // STREAM_H
