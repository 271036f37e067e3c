#pragma once

#include <fstream>
#include <string>
#include <vector>

/**
 * Minimal comma separated file access.  Fields never contain commas or
 * quotes, so no quoting is performed in either direction.
 */
class CSV
{
public:
	CSV(std::string path);
	bool good() const;
	bool get(std::vector<std::string> & row);
	bool eof();

	static std::string join(std::vector<std::string> const & fields);

private:
	std::ifstream file;
};
