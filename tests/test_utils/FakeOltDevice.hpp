#pragma once
#include "olt-client/transport/ByteStreamTransport.hpp"
#include "olt-client/types.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace oltclient {
namespace test {

/// One unit as the fake OLT reports it
struct FakeUnit {
  int index{1};
  std::string description;
  bool online{true};
  std::string mac{"74:a0:63:7e:d6:a8"};
  uint32_t distance{1436};
  uint32_t rtt{972};
  std::string last_reg{"1907/12/27 01:26:01"};
  std::string last_dereg{"N/A"};
  std::string dereg_reason{"N/A"};
  std::string alive{"42 02:24:43"};
};

/// In-memory OLT command line: answers login, enable, paging and the
/// interface / show onu commands the client issues, one line at a time.
class FakeOltDevice {
public:
  explicit FakeOltDevice(const std::string &hostname = "OLT1");

  /// Greeting for a fresh connection; resets the CLI mode
  std::string on_connect();

  /// Reply to one line the client sent (without CR LF)
  std::string handle_line(const std::string &line);

  void set_credentials(const std::string &username, const std::string &password,
                       const std::string &enable_password);
  void add_unit(const std::string &port, const FakeUnit &unit);
  void set_ports(const std::set<std::string> &ports);

  /// Replace the canned ctc replies for one unit index
  void set_optical_reply(int index, const std::string &reply);
  void set_link_reply(int index, const std::string &reply);
  void set_capability_reply(int index, const std::string &reply);

  /// When false the enable password is accepted but no '#' prompt follows
  void set_privileged_prompt(bool enabled);
  /// Answer `interface epon X` with this port's prompt instead
  void set_interface_prompt_override(const std::string &port);
  void set_echo(bool echo);

  /// The next time this exact line is sent the transport drops
  void set_drop_on_command(const std::string &line);
  bool take_drop(const std::string &line);

  std::vector<std::string> get_command_history() const;
  size_t count_command(const std::string &line) const;
  size_t connection_count() const;
  size_t login_count() const;
  void clear_history();

  static std::string status_line(const std::string &port, const FakeUnit &unit);

private:
  enum class Mode {
    LoginUser,
    LoginPassword,
    User,
    EnablePassword,
    Privileged,
    Config,
    Interface
  };

  std::string prompt() const;
  std::string reply_in_interface(const std::string &line);
  const FakeUnit *find_unit(int index) const;

  std::string hostname_;
  std::string username_{"admin"};
  std::string password_{"secret"};
  std::string enable_password_{"secret"};

  std::set<std::string> ports_{"0/1", "0/2", "0/3", "0/4"};
  std::map<std::string, std::vector<FakeUnit>> units_;
  std::map<int, std::string> optical_replies_;
  std::map<int, std::string> link_replies_;
  std::map<int, std::string> capability_replies_;

  bool privileged_prompt_{true};
  bool echo_{true};
  std::string interface_override_;
  std::string drop_on_command_;

  Mode mode_{Mode::LoginUser};
  std::string pending_user_;
  std::string current_port_;

  mutable std::mutex mutex_;
  std::vector<std::string> command_history_;
  size_t connections_{0};
  size_t logins_{0};
};

/// ByteStreamTransport that talks to a FakeOltDevice synchronously
class ScriptedTransport : public transport::ByteStreamTransport {
public:
  explicit ScriptedTransport(FakeOltDevice &device) : device_(device) {}

  void connect() override;
  void disconnect() override;
  bool is_connected() const override;
  void send_line(const std::string &line) override;
  std::string take_buffer() override;

  void set_refuse_connect(bool refuse) { refuse_connect_ = refuse; }

  /// Deliver the "# " of an interface prompt one take_buffer() call after
  /// the rest of the prompt, as a slow link would
  void set_split_interface_prompt(bool split) { split_prompt_ = split; }

  /// Queue raw bytes as if the device sent them
  void inject(const std::string &bytes);

private:
  FakeOltDevice &device_;
  bool refuse_connect_{false};
  bool split_prompt_{false};

  mutable std::mutex mutex_;
  bool connected_{false};
  std::string buffer_;
  std::string held_;
};

/// Device settings with short waits so failure paths finish quickly
DeviceConfig fast_device_config(const std::string &name = "OLT1");

} // namespace test
} // namespace oltclient
