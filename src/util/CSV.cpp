#include "CSV.hpp"

#include <sstream>

CSV::CSV(std::string path)
: file(path)
{ }


bool CSV::good() const
{
	return file.is_open() && !file.bad();
}

bool CSV::get(std::vector<std::string> & row)
{
	std::string str;
	row.clear();
	if (!std::getline(file, str))
		return false;
	if (!str.empty() && str[str.size()-1] == '\r')
		str.erase(str.size()-1);
	std::stringstream ss; ss << str;
	std::string item;
	while (std::getline(ss, item, ','))
		row.push_back(item);
	return true;
}

bool CSV::eof()
{
	return file.eof();
}

std::string CSV::join(std::vector<std::string> const & fields)
{
	std::string ret;
	for (size_t i = 0; i < fields.size(); ++ i) {
		if (i) ret += ',';
		ret += fields[i];
	}
	return ret;
}
