#include "device/imobiledevice_backend.hpp"

#include <libimobiledevice/afc.h>
#include <libimobiledevice/installation_proxy.h>
#include <plist/plist.h>

#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <memory>
#include <type_traits>
#include <vector>

#include "my_error_codes.hpp"

namespace carrierctrl {
namespace device {

namespace trivial = boost::log::trivial;

namespace {

struct PlistDeleter {
  void operator()(plist_t p) const { plist_free(p); }
};
using plist_raii = std::unique_ptr<void, PlistDeleter>;

struct CStrDeleter {
  void operator()(char *p) const { std::free(p); }
};
using cstr_raii = std::unique_ptr<char, CStrDeleter>;

struct AfcDeleter {
  void operator()(afc_client_t p) const { afc_client_free(p); }
};
using afc_raii = std::unique_ptr<std::remove_pointer_t<afc_client_t>, AfcDeleter>;

struct InstproxyDeleter {
  void operator()(instproxy_client_t p) const { instproxy_client_free(p); }
};
using instproxy_raii =
    std::unique_ptr<std::remove_pointer_t<instproxy_client_t>, InstproxyDeleter>;

std::optional<std::string> plist_to_text(plist_t node) {
  switch (plist_get_node_type(node)) {
  case PLIST_STRING: {
    char *raw = nullptr;
    plist_get_string_val(node, &raw);
    cstr_raii s(raw);
    if (!s) {
      return std::nullopt;
    }
    return std::string(s.get());
  }
  case PLIST_UINT: {
    uint64_t v = 0;
    plist_get_uint_val(node, &v);
    return std::to_string(v);
  }
  case PLIST_BOOLEAN: {
    uint8_t v = 0;
    plist_get_bool_val(node, &v);
    return std::string(v ? "true" : "false");
  }
  case PLIST_REAL: {
    double v = 0;
    plist_get_real_val(node, &v);
    return fmt::format("{}", v);
  }
  default:
    return std::nullopt;
  }
}

std::shared_ptr<IMobileDeviceHandle> as_native(const DeviceHandlePtr &handle) {
  return std::dynamic_pointer_cast<IMobileDeviceHandle>(handle);
}

} // namespace

// ---------------------------------------------------------------------------
// IMobileDeviceHandle

IMobileDeviceHandle::IMobileDeviceHandle(idevice_t device,
                                         lockdownd_client_t lockdown,
                                         std::string udid)
    : device_(device), lockdown_(lockdown), udid_(std::move(udid)) {}

IMobileDeviceHandle::~IMobileDeviceHandle() {
  if (lockdown_) {
    lockdownd_client_free(lockdown_);
  }
  if (device_) {
    idevice_free(device_);
  }
}

std::optional<std::string>
IMobileDeviceHandle::get_value(const std::string &key,
                               const std::string &domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  plist_t raw = nullptr;
  auto err = lockdownd_get_value(lockdown_,
                                 domain.empty() ? nullptr : domain.c_str(),
                                 key.c_str(), &raw);
  plist_raii node(raw);
  if (err != LOCKDOWN_E_SUCCESS || !node) {
    return std::nullopt;
  }
  return plist_to_text(node.get());
}

// ---------------------------------------------------------------------------
// IMobileDeviceConnector

DeviceHandlePtr IMobileDeviceConnector::connect_first() {
  idevice_t dev = nullptr;
  auto derr = idevice_new(&dev, nullptr);
  if (derr != IDEVICE_E_SUCCESS || !dev) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "idevice_new failed, err=" << static_cast<int>(derr);
    return nullptr;
  }

  lockdownd_client_t client = nullptr;
  auto lerr = lockdownd_client_new_with_handshake(dev, &client, kServiceLabel);
  if (lerr != LOCKDOWN_E_SUCCESS) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Lockdown handshake failed, err=" << static_cast<int>(lerr)
        << " (is the device unlocked and trusting this host?)";
    idevice_free(dev);
    return nullptr;
  }

  char *raw_udid = nullptr;
  std::string udid;
  if (idevice_get_udid(dev, &raw_udid) == IDEVICE_E_SUCCESS && raw_udid) {
    cstr_raii guard(raw_udid);
    udid = guard.get();
  }
  BOOST_LOG_SEV(lg_, trivial::debug) << "Opened device " << udid;
  return std::make_shared<IMobileDeviceHandle>(dev, client, std::move(udid));
}

// ---------------------------------------------------------------------------
// IMobileDevicePresenceSource

IMobileDevicePresenceSource::~IMobileDevicePresenceSource() {
  if (subscribed_.exchange(false)) {
    idevice_event_unsubscribe();
  }
}

std::optional<Error>
IMobileDevicePresenceSource::subscribe(Handler handler) {
  if (subscribed_.load()) {
    return make_error(my_errors::DEVICE::SUBSCRIPTION_FAILED,
                      "Already subscribed to device events.");
  }
  handler_ = std::move(handler);
  auto err = idevice_event_subscribe(&IMobileDevicePresenceSource::on_event,
                                     this);
  if (err != IDEVICE_E_SUCCESS) {
    handler_ = nullptr;
    return make_error(
        my_errors::DEVICE::SUBSCRIPTION_FAILED,
        fmt::format("idevice_event_subscribe failed, err={}",
                    static_cast<int>(err)));
  }
  subscribed_.store(true);
  return std::nullopt;
}

void IMobileDevicePresenceSource::on_event(const idevice_event_t *event,
                                           void *user_data) {
  auto *self = static_cast<IMobileDevicePresenceSource *>(user_data);
  if (!self || !event || !self->handler_) {
    return;
  }
  if (event->conn_type == CONNECTION_NETWORK) {
    return;
  }
  switch (event->event) {
  case IDEVICE_DEVICE_ADD:
    self->handler_(PresenceEvent::Connected);
    break;
  case IDEVICE_DEVICE_REMOVE:
    self->handler_(PresenceEvent::Disconnected);
    break;
  case IDEVICE_DEVICE_PAIRED:
    self->handler_(PresenceEvent::Paired);
    break;
  default:
    break;
  }
}

// ---------------------------------------------------------------------------
// IMobileDeviceSyslogSource

IMobileDeviceSyslogSource::~IMobileDeviceSyslogSource() { stop(); }

std::optional<Error>
IMobileDeviceSyslogSource::start(const DeviceHandlePtr &handle,
                                 LineHandler on_line) {
  auto native = as_native(handle);
  if (!native) {
    return make_error(my_errors::DEVICE::UNSUPPORTED_HANDLE,
                      "Syslog capture needs a libimobiledevice handle.");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (client_) {
    return make_error(my_errors::LOGSTREAM::CAPTURE_FAILED,
                      "Syslog capture is already running.");
  }
  syslog_relay_client_t client = nullptr;
  auto err = syslog_relay_client_start_service(native->device(), &client,
                                               kServiceLabel);
  if (err != SYSLOG_RELAY_E_SUCCESS || !client) {
    return make_error(my_errors::DEVICE::SERVICE_START_FAILED,
                      fmt::format("Could not start syslog_relay, err={}",
                                  static_cast<int>(err)));
  }

  {
    std::lock_guard<std::mutex> line_lock(line_mutex_);
    buffer_.clear();
    on_line_ = std::move(on_line);
  }
  err = syslog_relay_start_capture(client, &IMobileDeviceSyslogSource::on_char,
                                   this);
  if (err != SYSLOG_RELAY_E_SUCCESS) {
    syslog_relay_client_free(client);
    std::lock_guard<std::mutex> line_lock(line_mutex_);
    on_line_ = nullptr;
    return make_error(my_errors::LOGSTREAM::CAPTURE_FAILED,
                      fmt::format("Could not start syslog capture, err={}",
                                  static_cast<int>(err)));
  }
  client_ = client;
  BOOST_LOG_SEV(lg_, trivial::debug) << "syslog_relay capture running";
  return std::nullopt;
}

void IMobileDeviceSyslogSource::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!client_) {
    return;
  }
  // Joins the capture thread, so on_char never runs after this.
  syslog_relay_stop_capture(client_);
  syslog_relay_client_free(client_);
  client_ = nullptr;

  std::lock_guard<std::mutex> line_lock(line_mutex_);
  on_line_ = nullptr;
  buffer_.clear();
  BOOST_LOG_SEV(lg_, trivial::debug) << "syslog_relay capture stopped";
}

void IMobileDeviceSyslogSource::on_char(char c, void *user_data) {
  auto *self = static_cast<IMobileDeviceSyslogSource *>(user_data);
  if (c == '\0') {
    return;
  }
  std::string line;
  LineHandler handler;
  {
    std::lock_guard<std::mutex> lock(self->line_mutex_);
    if (c != '\n') {
      self->buffer_.push_back(c);
      return;
    }
    line.swap(self->buffer_);
    handler = self->on_line_;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (handler && !line.empty()) {
    handler(std::move(line));
  }
}

// ---------------------------------------------------------------------------
// IMobileDeviceInstaller

namespace {

struct InstallProgress {
  std::mutex mutex;
  std::condition_variable cv;
  bool done{false};
  std::optional<Error> error;
  IBundleInstaller::ProgressHandler on_progress;
  boost::log::sources::severity_logger_mt<trivial::severity_level> *lg{nullptr};
};

void on_install_status(plist_t /*command*/, plist_t status, void *user_data) {
  auto *progress = static_cast<InstallProgress *>(user_data);
  if (!progress || !status) {
    return;
  }

  char *raw_err_name = nullptr;
  char *raw_err_desc = nullptr;
  uint64_t err_code = 0;
  if (instproxy_status_get_error(status, &raw_err_name, &raw_err_desc,
                                 &err_code) != INSTPROXY_E_SUCCESS) {
    cstr_raii name(raw_err_name);
    cstr_raii desc(raw_err_desc);
    std::lock_guard<std::mutex> lock(progress->mutex);
    progress->error = make_error(
        my_errors::INSTALL::REPORTED_ERROR,
        fmt::format("{} ({}): {}", name ? name.get() : "Error", err_code,
                    desc ? desc.get() : ""));
    progress->done = true;
    progress->cv.notify_all();
    return;
  }

  char *raw_name = nullptr;
  instproxy_status_get_name(status, &raw_name);
  cstr_raii name(raw_name);
  if (!name) {
    return;
  }
  std::string status_name = name.get();
  const bool complete = status_name == "Complete";
  int percent = -1;
  instproxy_status_get_percent_complete(status, &percent);

  std::string text = fmt::format("Status: {}", complete ? "Completed"
                                                        : status_name);
  if (percent >= 0) {
    text += fmt::format(", PercentComplete: {}", percent);
  }
  if (progress->on_progress) {
    try {
      progress->on_progress(text);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(*progress->lg, trivial::error)
          << "Progress handler threw: " << e.what();
    }
  }
  if (complete) {
    std::lock_guard<std::mutex> lock(progress->mutex);
    progress->done = true;
    progress->cv.notify_all();
  }
}

} // namespace

std::optional<Error> IMobileDeviceInstaller::install(
    const DeviceHandlePtr &handle, const std::filesystem::path &bundle,
    const InstallOptions &options, ProgressHandler on_progress) {
  auto native = as_native(handle);
  if (!native) {
    return make_error(my_errors::DEVICE::UNSUPPORTED_HANDLE,
                      "Installer needs a libimobiledevice handle.");
  }

  const auto remote_path =
      fmt::format("{}/{}", options.staging_dir, bundle.filename().string());
  if (auto err = upload(native->device(), bundle, options.staging_dir,
                        remote_path)) {
    return err;
  }

  instproxy_client_t raw_ip = nullptr;
  auto ierr = instproxy_client_start_service(native->device(), &raw_ip,
                                             kServiceLabel);
  if (ierr != INSTPROXY_E_SUCCESS || !raw_ip) {
    return make_error(my_errors::INSTALL::START_FAILED,
                      fmt::format("Could not start installation_proxy, err={}",
                                  static_cast<int>(ierr)));
  }

  InstallProgress progress;
  progress.on_progress = std::move(on_progress);
  progress.lg = &lg_;
  {
    // Declared after progress: freeing the client joins the status thread,
    // which must happen before progress goes away.
    instproxy_raii ip(raw_ip);
    plist_raii client_opts(instproxy_client_options_new());
    instproxy_client_options_add(client_opts.get(), "PackageType",
                                 options.package_type.c_str(), nullptr);

    BOOST_LOG_SEV(lg_, trivial::info)
        << "Installing " << remote_path << " as " << options.package_type;
    ierr = instproxy_install(ip.get(), remote_path.c_str(), client_opts.get(),
                             &on_install_status, &progress);
    if (ierr != INSTPROXY_E_SUCCESS) {
      return make_error(my_errors::INSTALL::START_FAILED,
                        fmt::format("instproxy_install failed, err={}",
                                    static_cast<int>(ierr)));
    }

    std::unique_lock<std::mutex> lock(progress.mutex);
    if (!progress.cv.wait_for(lock, options.completion_timeout,
                              [&progress] { return progress.done; })) {
      return make_error(my_errors::INSTALL::NO_COMPLETION,
                        "Device installer did not finish in time.");
    }
  }
  return progress.error;
}

std::optional<Error>
IMobileDeviceInstaller::upload(idevice_t device,
                               const std::filesystem::path &bundle,
                               const std::string &remote_dir,
                               const std::string &remote_path) {
  std::ifstream in(bundle, std::ios::binary);
  if (!in) {
    return make_error(my_errors::INSTALL::START_FAILED,
                      fmt::format("Cannot read bundle {}", bundle.string()));
  }

  afc_client_t raw_afc = nullptr;
  auto aerr = afc_client_start_service(device, &raw_afc, kServiceLabel);
  if (aerr != AFC_E_SUCCESS || !raw_afc) {
    return make_error(my_errors::DEVICE::SERVICE_START_FAILED,
                      fmt::format("Could not start AFC, err={}",
                                  static_cast<int>(aerr)));
  }
  afc_raii afc(raw_afc);
  // Fails harmlessly when the directory already exists.
  afc_make_directory(afc.get(), remote_dir.c_str());

  uint64_t fh = 0;
  aerr = afc_file_open(afc.get(), remote_path.c_str(), AFC_FOPEN_WRONLY, &fh);
  if (aerr != AFC_E_SUCCESS) {
    return make_error(my_errors::INSTALL::UPLOAD_FAILED,
                      fmt::format("Cannot create {} on device, err={}",
                                  remote_path, static_cast<int>(aerr)));
  }

  std::vector<char> chunk(64 * 1024);
  std::size_t total = 0;
  std::optional<Error> result;
  while (in && !result) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto got = static_cast<uint32_t>(in.gcount());
    uint32_t offset = 0;
    while (offset < got) {
      uint32_t written = 0;
      aerr = afc_file_write(afc.get(), fh, chunk.data() + offset,
                            got - offset, &written);
      if (aerr != AFC_E_SUCCESS || written == 0) {
        result = make_error(my_errors::INSTALL::UPLOAD_FAILED,
                            fmt::format("Write to {} failed, err={}",
                                        remote_path, static_cast<int>(aerr)));
        break;
      }
      offset += written;
    }
    total += offset;
  }
  afc_file_close(afc.get(), fh);
  if (!result) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Uploaded " << total << " bytes to " << remote_path;
  }
  return result;
}

} // namespace device
} // namespace carrierctrl
