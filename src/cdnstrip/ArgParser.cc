/** @file

  Command line parsing implementation.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sysexits.h>

#include "cdnstrip/ArgParser.h"

#ifndef CDNSTRIP_VERSION
#define CDNSTRIP_VERSION "unknown"
#endif

namespace
{
std::string global_usage;
std::string parser_program_name;
std::string description_text;

const std::string empty_string;

// Consume the arguments of option or command @a name found at @a index.
std::string
handle_args(cdnstrip::Arguments &ret, cdnstrip::AP_StrVec &args, std::string const &name, unsigned arg_num, unsigned &index)
{
  ret.mark_called(name);
  if (arg_num == MORE_THAN_ZERO_ARG_N || arg_num == MORE_THAN_ONE_ARG_N) {
    // infinite arguments
    if (arg_num == MORE_THAN_ONE_ARG_N && args.size() <= index + 1) {
      return "at least one argument expected by " + name;
    }
    for (unsigned j = index + 1; j < args.size(); j++) {
      ret.append_arg(name, args[j]);
    }
    args.erase(args.begin() + index, args.end());
    return "";
  }
  // finite number of argument handling
  for (unsigned j = 0; j < arg_num; j++) {
    if (args.size() < index + j + 2 || args[index + j + 1].empty()) {
      return std::to_string(arg_num) + " argument(s) expected by " + name;
    }
    ret.append_arg(name, args[index + j + 1]);
  }
  // erase the used arguments and step the index back over the removed switch
  args.erase(args.begin() + index, args.begin() + index + arg_num + 1);
  --index;
  return "";
}

} // namespace

namespace cdnstrip
{
ArgParser::ArgParser(std::string const &name, std::string const &description)
{
  _top_level_command = ArgParser::Command(name, description, nullptr, name);
  description_text   = description;
}

ArgParser::Command &
ArgParser::add_option(std::string const &long_option, std::string const &short_option, std::string const &description,
                      std::string const &envvar, unsigned arg_num, std::string const &default_value, std::string const &key)
{
  return _top_level_command.add_option(long_option, short_option, description, envvar, arg_num, default_value, key);
}

ArgParser::Command &
ArgParser::add_command(std::string const &cmd_name, std::string const &cmd_description, Function const &f, std::string const &key)
{
  return _top_level_command.add_command(cmd_name, cmd_description, f, key);
}

void
ArgParser::add_global_usage(std::string const &usage)
{
  global_usage = usage;
}

void
ArgParser::add_description(std::string descr)
{
  description_text                = descr;
  _top_level_command._description = std::move(descr);
}

void
ArgParser::help_message(std::string_view err) const
{
  _top_level_command.help_message(err);
}

void
ArgParser::set_default_command(std::string const &cmd)
{
  if (_top_level_command._subcommand_list.find(cmd) == _top_level_command._subcommand_list.end()) {
    std::cerr << "Default command " << cmd << " not found" << std::endl;
    exit(EX_SOFTWARE);
  }
  _default_command = cmd;
}

Arguments
ArgParser::parse(const char **argv)
{
  // deal with argv first
  _argv.clear();
  for (int size = 0; argv[size]; ++size) {
    _argv.emplace_back(argv[size]);
  }
  if (_argv.empty()) {
    std::cerr << "Error: invalid argv provided" << std::endl;
    exit(EX_USAGE);
  }
  // the name of the program only
  _argv[0]                 = _argv[0].substr(_argv[0].find_last_of('/') + 1);
  _top_level_command._name = _argv[0];
  _top_level_command._key  = _argv[0];
  parser_program_name      = _argv[0];

  Arguments ret;
  AP_StrVec args = _argv;
  if (!_top_level_command.parse(ret, args) && !_default_command.empty()) {
    // no command named, parse again as if the default command was given
    ret  = Arguments();
    args = _argv;
    args.insert(args.begin() + 1, _default_command);
    _top_level_command.parse(ret, args);
  }

  // if there is anything left, then output usage
  if (!args.empty()) {
    std::string msg = "Unknown command, option or args:";
    for (auto const &it : args) {
      msg = msg + " '" + it + "'";
    }
    // find the correct level to output help message
    ArgParser::Command const *command = &_top_level_command;
    for (unsigned i = 1; i < _argv.size(); i++) {
      auto it = command->_subcommand_list.find(_argv[i]);
      if (it == command->_subcommand_list.end()) {
        break;
      }
      command = &it->second;
    }
    command->help_message(msg);
  }
  return ret;
}

//=========================== Command class ================================
ArgParser::Command::Command(std::string const &name, std::string const &description, Function const &f, std::string const &key)
  : _name(name), _description(description), _f(f), _key(key)
{
}

void
ArgParser::Command::check_option(std::string const &long_option, std::string const &short_option, std::string const &key) const
{
  if (long_option.size() < 3 || long_option[0] != '-' || long_option[1] != '-') {
    std::cerr << "Error: invalid long option added: '" + long_option + "'" << std::endl;
    exit(EX_SOFTWARE);
  }
  if (short_option.size() > 2 || (!short_option.empty() && short_option[0] != '-')) {
    std::cerr << "Error: invalid short option added: '" + short_option + "'" << std::endl;
    exit(EX_SOFTWARE);
  }
  if (_option_list.find(long_option) != _option_list.end() || _option_map.find(short_option) != _option_map.end()) {
    std::cerr << "Error: long/short option '" + long_option + "' already exists" << std::endl;
    exit(EX_SOFTWARE);
  }
  if (!key.empty() && key.find(' ') != std::string::npos) {
    std::cerr << "Error: key '" + key + "' must not contain spaces" << std::endl;
    exit(EX_SOFTWARE);
  }
}

void
ArgParser::Command::check_command(std::string const &name, std::string const &key) const
{
  if (name.empty() || name[0] == '-') {
    std::cerr << "Error: empty or invalid command name added" << std::endl;
    exit(EX_SOFTWARE);
  }
  if (_subcommand_list.find(name) != _subcommand_list.end()) {
    std::cerr << "Error: command already exists: '" + name + "'" << std::endl;
    exit(EX_SOFTWARE);
  }
  if (!key.empty() && key.find(' ') != std::string::npos) {
    std::cerr << "Error: key '" + key + "' must not contain spaces" << std::endl;
    exit(EX_SOFTWARE);
  }
}

ArgParser::Command &
ArgParser::Command::add_option(std::string const &long_option, std::string const &short_option, std::string const &description,
                               std::string const &envvar, unsigned arg_num, std::string const &default_value,
                               std::string const &key)
{
  std::string const lookup_key = key.empty() ? long_option.substr(2) : key;
  check_option(long_option, short_option, lookup_key);
  _option_list[long_option] = {long_option, short_option == "-" ? "" : short_option, description, envvar, arg_num, default_value,
                               lookup_key};
  if (short_option != "-" && !short_option.empty()) {
    _option_map[short_option] = long_option;
  }
  return *this;
}

ArgParser::Command &
ArgParser::Command::add_command(std::string const &cmd_name, std::string const &cmd_description, Function const &f,
                                std::string const &key)
{
  std::string const lookup_key = key.empty() ? cmd_name : key;
  check_command(cmd_name, lookup_key);
  _subcommand_list[cmd_name] = ArgParser::Command(cmd_name, cmd_description, f, lookup_key);
  return _subcommand_list[cmd_name];
}

ArgParser::Command &
ArgParser::Command::add_example_usage(std::string const &usage)
{
  _example_usage += "\n  " + usage;
  return *this;
}

// Method used by help_message()
void
ArgParser::Command::output_command(std::ostream &out, std::string const &prefix) const
{
  if (_name != parser_program_name) {
    // a nicely formatted way to output command usage
    std::string msg = prefix + _name;
    // nicely formatted output
    if (!_description.empty()) {
      if (INDENT_ONE - static_cast<int>(msg.size()) < 0) {
        // if the command msg is too long
        out << msg << "\n" << std::string(INDENT_ONE, ' ') << _description << std::endl;
      } else {
        out << msg << std::string(INDENT_ONE - msg.size(), ' ') << _description << std::endl;
      }
    }
  }
  // recursive call
  for (auto const &it : _subcommand_list) {
    it.second.output_command(out, "  " + prefix);
  }
}

// Method used by help_message()
void
ArgParser::Command::output_option(std::ostream &out) const
{
  for (auto const &it : _option_list) {
    std::string msg;
    if (!it.second.short_option.empty()) {
      msg = it.second.short_option + ", ";
    }
    msg += it.first;
    unsigned num = it.second.arg_num;
    if (num != 0) {
      if (num == 1) {
        msg = msg + " <arg>";
      } else if (num == MORE_THAN_ZERO_ARG_N) {
        msg = msg + " [<arg> ...]";
      } else if (num == MORE_THAN_ONE_ARG_N) {
        msg = msg + " <arg> ...";
      } else {
        msg = msg + " <arg1> ... <arg" + std::to_string(num) + ">";
      }
    }
    if (!it.second.default_value.empty()) {
      if (INDENT_ONE - static_cast<int>(msg.size()) < 0) {
        msg = msg + "\n" + std::string(INDENT_ONE, ' ') + it.second.default_value;
      } else {
        msg = msg + std::string(INDENT_ONE - msg.size(), ' ') + it.second.default_value;
      }
    }
    if (!it.second.description.empty()) {
      if (INDENT_TWO - static_cast<int>(msg.size()) < 0) {
        out << msg << "\n" << std::string(INDENT_TWO, ' ') << it.second.description << std::endl;
      } else {
        out << msg << std::string(INDENT_TWO - msg.size(), ' ') << it.second.description << std::endl;
      }
    }
  }
}

// output the help message and exit, with the usage status if there was an error
void
ArgParser::Command::help_message(std::string_view err) const
{
  std::ostream &out = err.empty() ? std::cout : std::cerr;
  if (!err.empty()) {
    out << "Error: " << err << std::endl;
  }
  // output description
  if (!_description.empty()) {
    out << _description << std::endl;
  } else if (!description_text.empty()) {
    out << description_text << std::endl;
  }
  // output the usage
  out << "\nUsage: " << (global_usage.empty() ? parser_program_name + " [OPTIONS]" : global_usage) << std::endl;
  // output subcommands
  if (!_subcommand_list.empty()) {
    out << "\nCommands ---------------------- Description -----------------------" << std::endl;
    output_command(out, "");
  }
  // output options
  if (!_option_list.empty()) {
    out << "\nOptions ======================= Default ===== Description =============" << std::endl;
    output_option(out);
  }
  // output example usage
  if (!_example_usage.empty()) {
    out << "\nExample Usage:" << _example_usage << std::endl;
  }
  exit(err.empty() ? EX_OK : EX_USAGE);
}

void
ArgParser::Command::version_message() const
{
  std::cout << parser_program_name << " " << CDNSTRIP_VERSION << std::endl;
  exit(EX_OK);
}

// Pull the options this command knows about out of @a args.
void
ArgParser::Command::append_option_data(Arguments &ret, AP_StrVec &args)
{
  for (unsigned i = 0; i < args.size(); i++) {
    std::string const &arg = args[i];
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-' && arg.find('=') != std::string::npos) {
      // deal with --arg=value
      std::string option_name = arg.substr(0, arg.find('='));
      std::string value       = arg.substr(arg.find('=') + 1);
      auto        it          = _option_list.find(option_name);
      if (it == _option_list.end()) {
        continue;
      }
      if (value.empty() || it->second.arg_num == 0) {
        help_message("invalid argument for '" + option_name + "'");
      }
      ret.mark_called(it->second.key);
      ret.append_arg(it->second.key, value);
      args.erase(args.begin() + i);
      --i;
      continue;
    }

    // output version message
    if ((arg == "--version" || arg == "-V") && _option_list.find("--version") != _option_list.end()) {
      version_message();
    }
    // output help message
    if ((arg == "--help" || arg == "-h") && _option_list.find("--help") != _option_list.end()) {
      ArgParser::Command const *command = this;
      // find the correct level to output help message
      for (auto const &name : args) {
        auto it = command->_subcommand_list.find(name);
        if (it != command->_subcommand_list.end()) {
          command = &it->second;
        }
      }
      command->help_message();
    }

    // deal with normal --arg val1 val2 ...
    auto long_it  = _option_list.find(arg);
    auto short_it = _option_map.find(arg);
    if (long_it == _option_list.end() && short_it == _option_map.end()) {
      continue;
    }
    Option const &cur_option = long_it != _option_list.end() ? long_it->second : _option_list.at(short_it->second);
    std::string   err        = handle_args(ret, args, cur_option.key, cur_option.arg_num, i);
    if (!err.empty()) {
      help_message(err);
    }
  }
}

// Parse the command at the front of @a args.
bool
ArgParser::Command::parse(Arguments &ret, AP_StrVec &args)
{
  if (args.empty() || args.front() != _name) {
    return false;
  }
  args.erase(args.begin());
  ret.mark_called(_key);
  if (_f) {
    // a deeper command replaces the action of its parent
    ret._action = _f;
  }

  append_option_data(ret, args);

  // set ENV var and default values for the options of this command
  for (auto const &[name, option] : _option_list) {
    if (!option.envvar.empty()) {
      const char *const env = getenv(option.envvar.c_str());
      ret.set_env(option.key, nullptr == env ? "" : env);
    }
    if (!option.default_value.empty() && ret.get(option.key).size() == 0) {
      std::istringstream ss(option.default_value);
      std::string        token;
      while (std::getline(ss, token, ' ')) {
        ret.append_arg(option.key, token);
      }
    }
  }

  bool flag = false;
  for (auto &[name, command] : _subcommand_list) {
    if (command.parse(ret, args)) {
      flag = true;
      break;
    }
  }
  if (_name == parser_program_name) {
    // at the top level, report whether a command was found
    return flag;
  }
  return true;
}

//=========================== Arguments class ================================

ArgumentData
Arguments::get(std::string const &name) const
{
  if (auto it = _data_map.find(name); it != _data_map.end()) {
    return it->second;
  }
  return ArgumentData();
}

void
Arguments::mark_called(std::string const &key)
{
  _data_map[key]._is_called = true;
}

void
Arguments::append_arg(std::string const &key, std::string const &value)
{
  _data_map[key]._values.push_back(value);
}

void
Arguments::set_env(std::string const &key, std::string const &value)
{
  _data_map[key]._env_value = value;
}

void
Arguments::invoke()
{
  if (!_action) {
    throw std::runtime_error("no command function to invoke");
  }
  _action();
}

bool
Arguments::has_action() const
{
  return static_cast<bool>(_action);
}

//=========================== ArgumentData class ================================

std::string const &
ArgumentData::env() const noexcept
{
  return _env_value;
}

std::string const &
ArgumentData::at(unsigned index) const
{
  if (index >= _values.size()) {
    throw std::out_of_range("argument not found at index: " + std::to_string(index));
  }
  return _values.at(index);
}

std::string const &
ArgumentData::value() const noexcept
{
  if (_values.empty()) {
    return empty_string;
  }
  return _values.at(0);
}

size_t
ArgumentData::size() const noexcept
{
  return _values.size();
}

bool
ArgumentData::empty() const noexcept
{
  return _values.empty() && _env_value.empty();
}

AP_StrVec::const_iterator
ArgumentData::begin() const noexcept
{
  return _values.begin();
}

AP_StrVec::const_iterator
ArgumentData::end() const noexcept
{
  return _values.end();
}

} // namespace cdnstrip
