/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_OPTIONS_H_
#define S3FCP_OPTIONS_H_

#include <map>
#include <string>
#include <vector>

/**
 * Key-value store of configuration parameters.  Parameters come from
 * configuration files in "KEY=VALUE" format and from the process environment.
 * For each parameter the value and its source are kept.
 *
 * Configuration file syntax: one assignment per line, '#' starts a comment,
 * "export " and "readonly " prefixes are ignored and single or double quotes
 * around the value are removed.  A later file overwrites earlier values.
 */
class SimpleOptionsParser {
 public:
  SimpleOptionsParser() { }

  /**
   * Returns false if the file cannot be opened.
   */
  bool TryParsePath(const std::string &config_file);
  /**
   * Imports all environment variables that start with one of the given
   * prefixes.  Parameters that are already defined, e.g. by a configuration
   * file, are not overwritten.
   */
  void ParseEnvironment(const std::vector<std::string> &prefixes);

  void ClearConfig() { config_.clear(); }
  bool IsDefined(const std::string &key);
  /**
   * Gets the stored value for a concrete variable
   *
   * @param  key variable to be accessed in the map
   * @param  value container of the received value, if it exists
   * @return true if there was a value stored in the map for key
   */
  bool GetValue(const std::string &key, std::string *value);
  bool GetSource(const std::string &key, std::string *value);
  /**
   * @return true if param has as value "YES", "ON", "TRUE" or "1"
   */
  bool IsOn(const std::string &param_value);
  std::vector<std::string> GetAllKeys();
  /**
   * "KEY=VALUE    # from SOURCE" lines of all parameters
   */
  std::string Dump();

  void SetValue(const std::string &key, const std::string &value);
  void UnsetValue(const std::string &key);

 protected:
  struct ConfigValue {
    std::string value;
    std::string source;
  };

  std::string TrimParameter(const std::string &parameter);
  std::string SanitizeParameterAssignment(std::string *line,
                                          std::vector <std::string> *tokens);
  void PopulateParameter(const std::string &param, const ConfigValue val);

  std::map<std::string, ConfigValue> config_;
};

#endif  // S3FCP_OPTIONS_H_
