// Copyright 2020-2024 Kevin Backhouse.
//
// This file is part of BusWire.
//
// BusWire is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// BusWire is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with BusWire.  If not, see <https://www.gnu.org/licenses/>.

#include "service_manager.hpp"
#include "utils.hpp"
#include <stdlib.h>
#include <unistd.h>

void check(bool ok, const char *what) {
  if (!ok) {
    throw Error(_s("Check failed: ") + what);
  }
}

std::string method_return(uint32_t replySerial, const DBusMessageBody &body) {
  return Message::methodReturn(1000 + replySerial, replySerial, ":1.1", body)
      ->toBytes();
}

std::string error_reply(uint32_t replySerial, const std::string &name) {
  return Message::error(1000 + replySerial, replySerial, ":1.1", name,
                        *DBusMessageBody::mk1(DBusObjectString::mk(
                            "Unit " + std::to_string(replySerial))))
      ->toBytes();
}

std::string job_reply(uint32_t replySerial) {
  return method_return(replySerial,
                       *DBusMessageBody::mk1(DBusObjectPath::mk(
                           "/org/freedesktop/systemd1/job/" +
                           std::to_string(replySerial))));
}

// The type of a struct of `n` strings.
DBusTypeStruct strings_type(size_t n) {
  std::vector<std::reference_wrapper<const DBusType>> fieldTypes(
      n, std::cref<DBusType>(DBusTypeString::instance_));
  return DBusTypeStruct(std::move(fieldTypes));
}

// Decode the method calls which the client wrote.
std::vector<std::unique_ptr<Message>> sent_calls(const ByteSinkBuffer &sink) {
  ByteSourceBuffer source(sink.getBytes());
  std::vector<std::unique_ptr<Message>> calls;
  while (source.remaining() > 0) {
    calls.push_back(receiveMessage(source));
  }
  return calls;
}

void check_manager_call(const Message &call, const char *member,
                        const char *signature) {
  check(call.getMessageType() == MSGTYPE_METHOD_CALL, "method call");
  check(call.getDestination() == "org.freedesktop.systemd1", "destination");
  check(call.getPath() == "/org/freedesktop/systemd1", "path");
  check(call.getInterface() == "org.freedesktop.systemd1.Manager",
        "interface");
  if (call.getMember() != member) {
    throw Error(_s("Expected a call to ") + member + ", got " +
                call.getMember());
  }
  const std::string sig =
      call.hasHeader(MSGHDR_SIGNATURE) ? call.getSignature() : std::string();
  if (sig != signature) {
    throw Error(_s(member) + ": wrong signature '" + sig + "'");
  }
}

void test_unit_object_path() {
  check(unitObjectPath("foo.service") ==
            "/org/freedesktop/systemd1/unit/foo_2eservice",
        "foo.service");
  check(unitObjectPath("a-b@1.service") ==
            "/org/freedesktop/systemd1/unit/a_2db_401_2eservice",
        "a-b@1.service");
  check(unitObjectPath("1x") == "/org/freedesktop/systemd1/unit/_31x",
        "leading digit");
  check(unitObjectPath("") == "/org/freedesktop/systemd1/unit/_", "empty");
}

void test_start_unit() {
  ByteSourceBuffer source(job_reply(1));
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  check(manager.startUnit("foo.service", "replace") ==
            "/org/freedesktop/systemd1/job/1",
        "job path");

  const auto calls = sent_calls(sink);
  check(calls.size() == 1, "one call");
  check_manager_call(*calls[0], "StartUnit", "ss");
  std::unique_ptr<DBusMessageBody> args = calls[0]->parseBody();
  check(args->getElement(0)->as<DBusObjectString>().getValue() ==
            "foo.service",
        "unit name argument");
  check(args->getElement(1)->as<DBusObjectString>().getValue() == "replace",
        "mode argument");
}

void test_unit_jobs() {
  std::string input;
  for (uint32_t serial = 1; serial <= 8; serial++) {
    input += job_reply(serial);
  }
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  manager.loadUnit("foo.service");
  manager.stopUnit("foo.service", "fail");
  manager.reloadUnit("foo.service", "fail");
  manager.restartUnit("foo.service", "fail");
  manager.tryRestartUnit("foo.service", "fail");
  manager.reloadOrRestartUnit("foo.service", "fail");
  check(manager.reloadOrTryRestartUnit("foo.service", "fail") ==
            "/org/freedesktop/systemd1/job/7",
        "seventh job");

  std::vector<UnitProperty> properties;
  properties.push_back(
      UnitProperty{"Description", DBusObjectString::mk("transient")});
  properties.push_back(UnitProperty{
      "ExecStart",
      DBusObjectArray::mk1(_vec<std::unique_ptr<DBusObject>>(
          DBusObjectString::mk("/bin/true")))});
  manager.startTransientUnit("run-1.service", "replace",
                             std::move(properties));

  const auto calls = sent_calls(sink);
  check(calls.size() == 8, "eight calls");
  check_manager_call(*calls[0], "LoadUnit", "s");
  check_manager_call(*calls[1], "StopUnit", "ss");
  check_manager_call(*calls[2], "ReloadUnit", "ss");
  check_manager_call(*calls[3], "RestartUnit", "ss");
  check_manager_call(*calls[4], "TryRestartUnit", "ss");
  check_manager_call(*calls[5], "ReloadOrRestartUnit", "ss");
  check_manager_call(*calls[6], "ReloadOrTryRestartUnit", "ss");
  check_manager_call(*calls[7], "StartTransientUnit", "ssa(sv)a(sa(sv))");

  std::unique_ptr<DBusMessageBody> args = calls[7]->parseBody();
  const DBusObjectArray &props = args->getElement(2)->as<DBusObjectArray>();
  check(props.numElements() == 2, "two properties");
  check(args->getElement(3)->as<DBusObjectArray>().numElements() == 0,
        "no auxiliary units");
}

void test_kill_and_subscribe() {
  std::string input;
  for (uint32_t serial = 1; serial <= 4; serial++) {
    input += method_return(serial, *DBusMessageBody::mk0());
  }
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  manager.killUnit("foo.service", 15);
  manager.subscribe();
  manager.unsubscribe();
  manager.reload();

  const auto calls = sent_calls(sink);
  check(calls.size() == 4, "four calls");
  check_manager_call(*calls[0], "KillUnit", "ssi");
  check(calls[0]->parseBody()->getElement(2)->as<DBusObjectInt32>().getValue() ==
            15,
        "signal argument");
  check_manager_call(*calls[1], "Subscribe", "");
  check_manager_call(*calls[2], "Unsubscribe", "");
  check_manager_call(*calls[3], "Reload", "");
}

void test_list_units() {
  std::unique_ptr<DBusObject> row = DBusObjectStruct::mk(
      _vec<std::unique_ptr<DBusObject>>(
          DBusObjectString::mk("foo.service"), DBusObjectString::mk("Foo"),
          DBusObjectString::mk("loaded"), DBusObjectString::mk("active"),
          DBusObjectString::mk("running"), DBusObjectString::mk(""),
          DBusObjectPath::mk("/org/freedesktop/systemd1/unit/foo_2eservice"),
          DBusObjectUint32::mk(0), DBusObjectString::mk(""),
          DBusObjectPath::mk("/")));
  ByteSourceBuffer source(method_return(
      1, *DBusMessageBody::mk1(DBusObjectArray::mk1(
             _vec<std::unique_ptr<DBusObject>>(std::move(row))))));
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  const std::vector<UnitStatus> units = manager.listUnits();
  check(units.size() == 1, "one unit");
  check(units[0].name == "foo.service", "unit name");
  check(units[0].activeState == "active", "active state");
  check(units[0].subState == "running", "sub state");
  check(units[0].path == "/org/freedesktop/systemd1/unit/foo_2eservice",
        "unit path");
  check(units[0].jobId == 0, "job id");
  check_manager_call(*sent_calls(sink)[0], "ListUnits", "");
}

void test_unit_files() {
  std::string input;
  input += method_return(
      1, *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
             DBusObjectBoolean::mk(true),
             DBusObjectArray::mk1(_vec<std::unique_ptr<DBusObject>>(
                 DBusObjectStruct::mk(_vec<std::unique_ptr<DBusObject>>(
                     DBusObjectString::mk("symlink"),
                     DBusObjectString::mk("/etc/systemd/system/foo.service"),
                     DBusObjectString::mk("/lib/foo.service"))))))));
  input += method_return(
      2, *DBusMessageBody::mk1(DBusObjectArray::mk0(strings_type(3))));
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  const EnableUnitFilesResult enabled =
      manager.enableUnitFiles(_vec<std::string>(_s("/lib/foo.service")), false,
                              true);
  check(enabled.carriesInstallInfo, "install info");
  check(enabled.changes.size() == 1, "one change");
  check(enabled.changes[0].type == "symlink", "change type");
  check(enabled.changes[0].destination == "/lib/foo.service",
        "change destination");

  check(manager.disableUnitFiles(_vec<std::string>(_s("foo.service")), true)
            .empty(),
        "no changes");

  const auto calls = sent_calls(sink);
  check_manager_call(*calls[0], "EnableUnitFiles", "asbb");
  check_manager_call(*calls[1], "DisableUnitFiles", "asb");
}

void test_get_unit_properties() {
  ByteSourceBuffer source(method_return(
      1, *DBusMessageBody::mk1(DBusObjectArray::mk1(
             _vec<std::unique_ptr<DBusObject>>(
                 DBusObjectDictEntry::mk(
                     DBusObjectString::mk("LoadState"),
                     DBusObjectVariant::mk(DBusObjectString::mk("loaded"))),
                 DBusObjectDictEntry::mk(
                     DBusObjectString::mk("NeedDaemonReload"),
                     DBusObjectVariant::mk(DBusObjectBoolean::mk(false))))))));
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  const UnitProperties props = manager.getUnitProperties("foo.service");
  check(props.size() == 2, "two properties");
  check(props.stringEquals("LoadState", "loaded"), "LoadState");
  check(!props.isTrue("NeedDaemonReload"), "NeedDaemonReload");
  check(!props.find("ActiveState"), "absent property");

  const auto calls = sent_calls(sink);
  check(calls[0]->getPath() == "/org/freedesktop/systemd1/unit/foo_2eservice",
        "unit object path");
  check(calls[0]->getInterface() == "org.freedesktop.DBus.Properties",
        "properties interface");
  check(calls[0]->getMember() == "GetAll", "GetAll");
}

// A unit file which exists, for the enable step.
class TempUnitFile {
  std::string path_;

public:
  TempUnitFile() {
    char path[] = "/tmp/buswire-unit-XXXXXX";
    const int fd = mkstemp(path);
    if (fd < 0) {
      throw ErrorWithErrno("mkstemp failed");
    }
    close(fd);
    path_ = path;
  }

  ~TempUnitFile() { unlink(path_.c_str()); }

  const std::string &get() const { return path_; }
};

void test_start_and_enable_unit() {
  TempUnitFile unitFile;

  std::string input;
  input += error_reply(1, SYSTEMD_ERROR_NO_SUCH_UNIT);
  input += method_return(
      2, *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
             DBusObjectBoolean::mk(false),
             DBusObjectArray::mk0(strings_type(3)))));
  input += method_return(
      3, *DBusMessageBody::mk1(DBusObjectArray::mk1(
             _vec<std::unique_ptr<DBusObject>>(DBusObjectDictEntry::mk(
                 DBusObjectString::mk("LoadState"),
                 DBusObjectVariant::mk(DBusObjectString::mk("not-found")))))));
  input += method_return(4, *DBusMessageBody::mk0());
  input += job_reply(5);
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  check(startAndEnableUnit(manager, "foo.service", unitFile.get(), "replace") ==
            "/org/freedesktop/systemd1/job/5",
        "job of the second start");

  const auto calls = sent_calls(sink);
  check(calls.size() == 5, "five calls");
  check_manager_call(*calls[0], "StartUnit", "ss");
  check_manager_call(*calls[1], "EnableUnitFiles", "asbb");
  check(calls[2]->getMember() == "GetAll", "GetAll");
  check_manager_call(*calls[3], "Reload", "");
  check_manager_call(*calls[4], "StartUnit", "ss");
}

void test_start_and_enable_no_reload() {
  TempUnitFile unitFile;

  std::string input;
  input += error_reply(1, SYSTEMD_ERROR_LOAD_FAILED);
  input += method_return(
      2, *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
             DBusObjectBoolean::mk(true),
             DBusObjectArray::mk0(strings_type(3)))));
  input += method_return(
      3, *DBusMessageBody::mk1(DBusObjectArray::mk1(
             _vec<std::unique_ptr<DBusObject>>(DBusObjectDictEntry::mk(
                 DBusObjectString::mk("LoadState"),
                 DBusObjectVariant::mk(DBusObjectString::mk("loaded")))))));
  input += job_reply(4);
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  startAndEnableUnit(manager, "foo.service", unitFile.get(), "replace");
  const auto calls = sent_calls(sink);
  check(calls.size() == 4, "four calls");
  check_manager_call(*calls[3], "StartUnit", "ss");
}

// The error name decides the recovery even if the body can't be parsed.
void test_start_and_enable_bad_error_body() {
  TempUnitFile unitFile;

  std::unique_ptr<Message> noSuchUnit = Message::error(
      1001, 1, ":1.1", SYSTEMD_ERROR_NO_SUCH_UNIT,
      *DBusMessageBody::mk1(DBusObjectString::mk("Unit 1")));
  noSuchUnit->setRawBody(std::string("\xff\xff", 2));

  std::string input = noSuchUnit->toBytes();
  input += method_return(
      2, *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
             DBusObjectBoolean::mk(true),
             DBusObjectArray::mk0(strings_type(3)))));
  input += method_return(
      3, *DBusMessageBody::mk1(DBusObjectArray::mk1(
             _vec<std::unique_ptr<DBusObject>>(DBusObjectDictEntry::mk(
                 DBusObjectString::mk("LoadState"),
                 DBusObjectVariant::mk(DBusObjectString::mk("loaded")))))));
  input += job_reply(4);
  ByteSourceBuffer source(input);
  ByteSinkBuffer sink;
  BusConnection conn(source, sink);
  ServiceManager manager(conn);

  check(startAndEnableUnit(manager, "foo.service", unitFile.get(), "replace") ==
            "/org/freedesktop/systemd1/job/4",
        "start after a malformed NoSuchUnit reply");
  const auto calls = sent_calls(sink);
  check(calls.size() == 4, "four calls after a malformed reply");
  check_manager_call(*calls[1], "EnableUnitFiles", "asbb");
}

void test_start_and_enable_errors() {
  // The unit file doesn't exist.
  {
    ByteSourceBuffer source(error_reply(1, SYSTEMD_ERROR_NO_SUCH_UNIT));
    ByteSinkBuffer sink;
    BusConnection conn(source, sink);
    ServiceManager manager(conn);
    try {
      startAndEnableUnit(manager, "foo.service", "/nonexistent/foo.service",
                         "replace");
      throw Error("Missing unit file didn't throw");
    } catch (const BusCallError &e) {
      check(isNoSuchUnit(e), "NoSuchUnit for a missing unit file");
    }
    check(sent_calls(sink).size() == 1, "no enable without a unit file");
  }

  // Other errors are passed through.
  {
    ByteSourceBuffer source(
        error_reply(1, "org.freedesktop.DBus.Error.AccessDenied"));
    ByteSinkBuffer sink;
    BusConnection conn(source, sink);
    ServiceManager manager(conn);
    try {
      startAndEnableUnit(manager, "foo.service", "/", "replace");
      throw Error("AccessDenied didn't throw");
    } catch (const BusCallError &e) {
      check(!isNoSuchUnit(e) && !isLoadFailed(e), "AccessDenied");
      check(e.getErrorName() == "org.freedesktop.DBus.Error.AccessDenied",
            "error name");
    }
  }
}

int main() {
  test_unit_object_path();
  test_start_unit();
  test_unit_jobs();
  test_kill_and_subscribe();
  test_list_units();
  test_unit_files();
  test_get_unit_properties();
  test_start_and_enable_unit();
  test_start_and_enable_no_reload();
  test_start_and_enable_bad_error_body();
  test_start_and_enable_errors();
  return 0;
}
