#ifndef __MEDIAMOVERCONFIG_HPP__
#define __MEDIAMOVERCONFIG_HPP__

#include <string>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

#include "loguru.hpp"

namespace MediaMover
{
// trim from start (in place)
static inline void ltrim(std::string &s)
{
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
    return !std::isspace(ch);
  }));
}

// trim from end (in place)
static inline void rtrim(std::string &s)
{
  s.erase(std::find_if(
            s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); })
            .base(),
    s.end());
}

// trim from both ends (in place)
static inline void trim(std::string &s)
{
  ltrim(s);
  rtrim(s);
}

/**
 * @brief reads "key = value" lines into a config struct. Text after '#' is
 * a comment. The per-struct parse() specialization maps the keys.
 */
template<class T> class MediaMoverConfig
{
public:
  MediaMoverConfig(T &config)
    : m_config(config)
  {
  }

  /**
   * @brief read the file into the config
   *
   * @param file path of the configuration file
   * @return true at least one key was read
   * @return false the file could not be opened or contained no keys
   * @throw std::invalid_argument unknown key or invalid value
   */
  bool read(const std::string &file)
  {
    std::ifstream fs(file, std::ios::in);
    if(!fs.is_open())
    {
      LOG_F(1, "Config file '%s' cannot be opened", file.c_str());
      return false;
    }

    return read(fs);
  }

  bool read(std::istream &fs)
  {
    bool readData = false;
    std::string line;
    while(std::getline(fs, line))
    {
      auto iComment = line.find('#');
      if(iComment != std::string::npos)
      {
        line.resize(iComment);
      }
      trim(line);

      auto iSep = line.find('=');
      if(iSep == std::string::npos)
        continue;

      auto key = line.substr(0, iSep);
      trim(key);
      auto value = line.substr(iSep + 1);
      trim(value);

      readData = true;
      if(!parse(key, value, m_config))
      {
        std::stringstream ss;
        ss << "could not parse key \"" << key << "\" with value \"" << value
           << "\"";
        throw std::invalid_argument(ss.str());
      }
    }
    return readData;
  }

private:
  T &m_config;

  bool parse(const std::string &key, const std::string &value, T &config);
};
}

#endif
