#include <cctype>
#include <string>
#include <string_view>

#include "stream.h"

static const char unnamed_stream[] = "unnamed";

std::string sanitize_name(const std::string_view& name)
{
	std::string ret;

	ret.reserve(name.size());

	for (const char c : name)
		if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')
			ret.push_back(c);

	if (ret.empty())
		ret = unnamed_stream;

	return ret;
}
