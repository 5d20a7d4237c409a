/**
 * This file is part of s3fcp.
 *
 * Fills configuration variables from config files and the environment.
 */

#include "options.h"

#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

extern char **environ;


string SimpleOptionsParser::TrimParameter(const string &parameter) {
  string result = Trim(parameter);
  // Strip "readonly"
  if (result.find("readonly ") == 0) {
    result = result.substr(9);
    result = Trim(result);
  } else if (result.find("export ") == 0) {
    result = result.substr(7);
    result = Trim(result);
  }
  return result;
}


string SimpleOptionsParser::SanitizeParameterAssignment(
  string *line,
  vector <string> *tokens)
{
  size_t comment_idx = line->find("#");
  if (comment_idx != string::npos)
    *line = line->substr(0, comment_idx);
  *line = Trim(*line);
  if (line->empty())
    return "";
  *tokens = SplitString(*line, '=');
  if (tokens->size() < 2)
    return "";
  string parameter = TrimParameter((*tokens)[0]);
  if (parameter.find(" ") != string::npos)
    return "";
  return parameter;
}


bool SimpleOptionsParser::TryParsePath(const string &config_file) {
  LogS3fcp(kLogOptions, kLogDebug, "parsing config file %s",
           config_file.c_str());
  string line;
  FILE *fconfig = fopen(config_file.c_str(), "r");
  if (fconfig == NULL)
    return false;

  // Read line by line and extract parameters
  while (GetLineFile(fconfig, &line)) {
    vector <string> tokens;
    string parameter = SanitizeParameterAssignment(&line, &tokens);
    if (parameter.empty())
      continue;

    // Strip quotes from value
    tokens.erase(tokens.begin());
    string value = Trim(JoinStrings(tokens, "="));
    unsigned value_length = value.length();
    if (value_length >= 2) {
      if ( ((value[0] == '"') && ((value[value_length - 1] == '"'))) ||
           ((value[0] == '\'') && ((value[value_length - 1] == '\''))) )
      {
        value = value.substr(1, value_length - 2);
      }
    }

    ConfigValue config_value;
    config_value.source = config_file;
    config_value.value = value;
    PopulateParameter(parameter, config_value);
  }
  fclose(fconfig);
  return true;
}


void SimpleOptionsParser::ParseEnvironment(const vector<string> &prefixes) {
  for (char **env = environ; (env != NULL) && (*env != NULL); ++env) {
    const string assignment(*env);
    const string::size_type pos_equal = assignment.find('=');
    if ((pos_equal == string::npos) || (pos_equal == 0))
      continue;
    const string key = assignment.substr(0, pos_equal);

    bool match = false;
    for (unsigned i = 0; i < prefixes.size(); ++i) {
      if (HasPrefix(key, prefixes[i], false)) {
        match = true;
        break;
      }
    }
    if (!match || IsDefined(key))
      continue;

    ConfigValue config_value;
    config_value.source = "environment";
    config_value.value = assignment.substr(pos_equal + 1);
    PopulateParameter(key, config_value);
  }
}


void SimpleOptionsParser::PopulateParameter(
  const string &param,
  const ConfigValue val)
{
  LogS3fcp(kLogOptions, kLogDebug, "%s set from %s", param.c_str(),
           val.source.c_str());
  config_[param] = val;
}


bool SimpleOptionsParser::IsDefined(const string &key) {
  return config_.find(key) != config_.end();
}


bool SimpleOptionsParser::GetValue(const string &key, string *value) {
  map<string, ConfigValue>::const_iterator iter = config_.find(key);
  if (iter != config_.end()) {
    *value = iter->second.value;
    return true;
  }
  *value = "";
  return false;
}


bool SimpleOptionsParser::GetSource(const string &key, string *value) {
  map<string, ConfigValue>::const_iterator iter = config_.find(key);
  if (iter != config_.end()) {
    *value = iter->second.source;
    return true;
  }
  *value = "";
  return false;
}


bool SimpleOptionsParser::IsOn(const std::string &param_value) {
  const string uppercase = ToUpper(param_value);
  return ((uppercase == "YES") || (uppercase == "ON") || (uppercase == "1") ||
          (uppercase == "TRUE"));
}


vector<string> SimpleOptionsParser::GetAllKeys() {
  vector<string> result;
  for (map<string, ConfigValue>::const_iterator i = config_.begin(),
       iEnd = config_.end(); i != iEnd; ++i)
  {
    result.push_back(i->first);
  }
  return result;
}


string SimpleOptionsParser::Dump() {
  string result;
  for (map<string, ConfigValue>::const_iterator i = config_.begin(),
       iEnd = config_.end(); i != iEnd; ++i)
  {
    // Credentials stay out of logs
    const bool is_secret = (i->first.find("SECRET") != string::npos) ||
                           (i->first.find("TOKEN") != string::npos);
    result += i->first + "=" + (is_secret ? "<hidden>" : i->second.value) +
              "    # from " + i->second.source + "\n";
  }
  return result;
}


void SimpleOptionsParser::SetValue(const string &key, const string &value) {
  ConfigValue config_value;
  config_value.source = "@INTERNAL@";
  config_value.value = value;
  PopulateParameter(key, config_value);
}


void SimpleOptionsParser::UnsetValue(const string &key) {
  config_.erase(key);
}
