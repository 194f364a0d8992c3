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
#include <stdio.h>
#include <unistd.h>

const char *const SYSTEMD_ERROR_NO_SUCH_UNIT =
    "org.freedesktop.systemd1.NoSuchUnit";
const char *const SYSTEMD_ERROR_LOAD_FAILED =
    "org.freedesktop.systemd1.LoadFailed";

static const char systemdDestination[] = "org.freedesktop.systemd1";
static const char systemdPath[] = "/org/freedesktop/systemd1";
static const char managerInterface[] = "org.freedesktop.systemd1.Manager";
static const char unitInterface[] = "org.freedesktop.systemd1.Unit";
static const char propertiesInterface[] = "org.freedesktop.DBus.Properties";

// Types of the empty arrays in method arguments.
static const DBusTypeStruct propertyType(
    _vec<std::reference_wrapper<const DBusType>>(
        std::cref<DBusType>(DBusTypeString::instance_),
        std::cref<DBusType>(DBusTypeVariant::instance_)));
static const DBusTypeArray propertiesType(propertyType);
static const DBusTypeStruct auxUnitType(
    _vec<std::reference_wrapper<const DBusType>>(
        std::cref<DBusType>(DBusTypeString::instance_),
        std::cref<DBusType>(propertiesType)));

UnitProperties::UnitProperties(std::unique_ptr<DBusMessageBody> &&body)
    : body_(std::move(body)) {
  if (body_->numElements() != 1) {
    throw Error(_s("GetAll: unexpected reply signature: ") +
                body_->signature());
  }
  const DBusObjectArray &array = body_->getElement(0)->as<DBusObjectArray>();
  const size_t n = array.numElements();
  for (size_t i = 0; i < n; i++) {
    const DBusObjectDictEntry &entry =
        array.getElement(i)->as<DBusObjectDictEntry>();
    const std::string &name = entry.getKey()->as<DBusObjectString>().getValue();
    const DBusObject &value =
        *entry.getValue()->as<DBusObjectVariant>().getValue();
    values_.insert_or_assign(name, &value);
  }
}

const DBusObject *UnitProperties::find(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return nullptr;
  }
  return it->second;
}

bool UnitProperties::stringEquals(const std::string &name,
                                  const std::string &value) const {
  const DBusObjectString *str =
      dynamic_cast<const DBusObjectString *>(find(name));
  return str && str->getValue() == value;
}

bool UnitProperties::isTrue(const std::string &name) const {
  const DBusObjectBoolean *b =
      dynamic_cast<const DBusObjectBoolean *>(find(name));
  return b && b->getValue();
}

// Checks that the reply has exactly `n` arguments.
static void checkNumArgs(const DBusMessageBody &body, const char *member,
                         size_t n) {
  if (body.numElements() != n) {
    throw Error(_s(member) + ": unexpected reply signature: '" +
                body.signature() + "'");
  }
}

static const std::string &stringArg(const DBusObject &obj) {
  return obj.as<DBusObjectString>().getValue();
}

static const std::string &pathArg(const DBusObject &obj) {
  return obj.as<DBusObjectPath>().getValue();
}

static std::unique_ptr<DBusObject>
stringArray(const std::vector<std::string> &strs) {
  std::vector<std::unique_ptr<DBusObject>> elements;
  elements.reserve(strs.size());
  for (const std::string &str : strs) {
    elements.push_back(DBusObjectString::mk(str));
  }
  return DBusObjectArray::mk(DBusTypeString::instance_, std::move(elements));
}

// Decode an array of UnitFileChange structs: a(sss).
static std::vector<UnitFileChange> unitFileChanges(const DBusObject &obj) {
  const DBusObjectArray &array = obj.as<DBusObjectArray>();
  std::vector<UnitFileChange> changes;
  changes.reserve(array.numElements());
  for (size_t i = 0; i < array.numElements(); i++) {
    const DBusObjectStruct &s = array.getElement(i)->as<DBusObjectStruct>();
    if (s.numFields() != 3) {
      throw Error("Unit file change has the wrong number of fields");
    }
    changes.push_back(UnitFileChange{stringArg(*s.getElement(0)),
                                     stringArg(*s.getElement(1)),
                                     stringArg(*s.getElement(2))});
  }
  return changes;
}

std::unique_ptr<DBusMessageBody>
ServiceManager::callManager(const std::string &member,
                            const DBusMessageBody &body) {
  return conn_.call(systemdDestination, systemdPath, managerInterface, member,
                    body);
}

std::string ServiceManager::callUnitJob(const std::string &member,
                                        const std::string &name,
                                        const std::string &mode) {
  std::unique_ptr<DBusMessageBody> reply =
      callManager(member, *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
                              DBusObjectString::mk(name),
                              DBusObjectString::mk(mode))));
  checkNumArgs(*reply, member.c_str(), 1);
  return pathArg(*reply->getElement(0));
}

std::string ServiceManager::loadUnit(const std::string &name) {
  std::unique_ptr<DBusMessageBody> reply = callManager(
      "LoadUnit", *DBusMessageBody::mk1(DBusObjectString::mk(name)));
  checkNumArgs(*reply, "LoadUnit", 1);
  return pathArg(*reply->getElement(0));
}

std::string ServiceManager::startUnit(const std::string &name,
                                      const std::string &mode) {
  return callUnitJob("StartUnit", name, mode);
}

std::string ServiceManager::stopUnit(const std::string &name,
                                     const std::string &mode) {
  return callUnitJob("StopUnit", name, mode);
}

std::string ServiceManager::reloadUnit(const std::string &name,
                                       const std::string &mode) {
  return callUnitJob("ReloadUnit", name, mode);
}

std::string ServiceManager::restartUnit(const std::string &name,
                                        const std::string &mode) {
  return callUnitJob("RestartUnit", name, mode);
}

std::string ServiceManager::tryRestartUnit(const std::string &name,
                                           const std::string &mode) {
  return callUnitJob("TryRestartUnit", name, mode);
}

std::string ServiceManager::reloadOrRestartUnit(const std::string &name,
                                                const std::string &mode) {
  return callUnitJob("ReloadOrRestartUnit", name, mode);
}

std::string ServiceManager::reloadOrTryRestartUnit(const std::string &name,
                                                   const std::string &mode) {
  return callUnitJob("ReloadOrTryRestartUnit", name, mode);
}

std::string
ServiceManager::startTransientUnit(const std::string &name,
                                   const std::string &mode,
                                   std::vector<UnitProperty> &&properties) {
  std::vector<std::unique_ptr<DBusObject>> props;
  props.reserve(properties.size());
  for (UnitProperty &prop : properties) {
    props.push_back(DBusObjectStruct::mk(_vec<std::unique_ptr<DBusObject>>(
        DBusObjectString::mk(prop.name),
        DBusObjectVariant::mk(std::move(prop.value)))));
  }

  // StartTransientUnit(ssa(sv)a(sa(sv))): the auxiliary units are always
  // empty.
  std::unique_ptr<DBusMessageBody> reply = callManager(
      "StartTransientUnit",
      *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
          DBusObjectString::mk(name), DBusObjectString::mk(mode),
          DBusObjectArray::mk(propertyType, std::move(props)),
          DBusObjectArray::mk0(auxUnitType))));
  checkNumArgs(*reply, "StartTransientUnit", 1);
  return pathArg(*reply->getElement(0));
}

void ServiceManager::killUnit(const std::string &name, int32_t signal) {
  std::unique_ptr<DBusMessageBody> reply =
      callManager("KillUnit", *DBusMessageBody::mk(
                                  _vec<std::unique_ptr<DBusObject>>(
                                      DBusObjectString::mk(name),
                                      DBusObjectString::mk("all"),
                                      DBusObjectInt32::mk(signal))));
  checkNumArgs(*reply, "KillUnit", 0);
}

UnitProperties ServiceManager::getUnitProperties(const std::string &name) {
  return UnitProperties(conn_.call(
      systemdDestination, unitObjectPath(name), propertiesInterface, "GetAll",
      *DBusMessageBody::mk1(DBusObjectString::mk(unitInterface))));
}

std::vector<UnitStatus> ServiceManager::listUnits() {
  std::unique_ptr<DBusMessageBody> reply =
      callManager("ListUnits", *DBusMessageBody::mk0());
  checkNumArgs(*reply, "ListUnits", 1);

  // a(ssssssouso)
  const DBusObjectArray &array = reply->getElement(0)->as<DBusObjectArray>();
  std::vector<UnitStatus> units;
  units.reserve(array.numElements());
  for (size_t i = 0; i < array.numElements(); i++) {
    const DBusObjectStruct &s = array.getElement(i)->as<DBusObjectStruct>();
    if (s.numFields() != 10) {
      throw Error("Unit status has the wrong number of fields");
    }
    UnitStatus unit;
    unit.name = stringArg(*s.getElement(0));
    unit.description = stringArg(*s.getElement(1));
    unit.loadState = stringArg(*s.getElement(2));
    unit.activeState = stringArg(*s.getElement(3));
    unit.subState = stringArg(*s.getElement(4));
    unit.followed = stringArg(*s.getElement(5));
    unit.path = pathArg(*s.getElement(6));
    unit.jobId = s.getElement(7)->as<DBusObjectUint32>().getValue();
    unit.jobType = stringArg(*s.getElement(8));
    unit.jobPath = pathArg(*s.getElement(9));
    units.push_back(std::move(unit));
  }
  return units;
}

EnableUnitFilesResult
ServiceManager::enableUnitFiles(const std::vector<std::string> &files,
                                bool runtime, bool force) {
  std::unique_ptr<DBusMessageBody> reply = callManager(
      "EnableUnitFiles", *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
                             stringArray(files), DBusObjectBoolean::mk(runtime),
                             DBusObjectBoolean::mk(force))));
  checkNumArgs(*reply, "EnableUnitFiles", 2);
  EnableUnitFilesResult result;
  result.carriesInstallInfo =
      reply->getElement(0)->as<DBusObjectBoolean>().getValue();
  result.changes = unitFileChanges(*reply->getElement(1));
  return result;
}

std::vector<UnitFileChange>
ServiceManager::disableUnitFiles(const std::vector<std::string> &files,
                                 bool runtime) {
  std::unique_ptr<DBusMessageBody> reply = callManager(
      "DisableUnitFiles",
      *DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
          stringArray(files), DBusObjectBoolean::mk(runtime))));
  checkNumArgs(*reply, "DisableUnitFiles", 1);
  return unitFileChanges(*reply->getElement(0));
}

void ServiceManager::subscribe() {
  checkNumArgs(*callManager("Subscribe", *DBusMessageBody::mk0()), "Subscribe",
               0);
}

void ServiceManager::unsubscribe() {
  checkNumArgs(*callManager("Unsubscribe", *DBusMessageBody::mk0()),
               "Unsubscribe", 0);
}

void ServiceManager::reload() {
  checkNumArgs(*callManager("Reload", *DBusMessageBody::mk0()), "Reload", 0);
}

std::string unitObjectPath(const std::string &name) {
  static const char hex[] = "0123456789abcdef";
  std::string result(systemdPath);
  result += "/unit/";
  if (name.empty()) {
    result.push_back('_');
    return result;
  }
  for (size_t i = 0; i < name.size(); i++) {
    const unsigned char c = name[i];
    const bool isDigit = '0' <= c && c <= '9';
    const bool isAlpha = ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
    // A leading digit is escaped too.
    if (isAlpha || (isDigit && i > 0)) {
      result.push_back(c);
    } else {
      result.push_back('_');
      result.push_back(hex[c >> 4]);
      result.push_back(hex[c & 0xf]);
    }
  }
  return result;
}

bool isNoSuchUnit(const BusCallError &e) {
  return e.getErrorName() == SYSTEMD_ERROR_NO_SUCH_UNIT;
}

bool isLoadFailed(const BusCallError &e) {
  return e.getErrorName() == SYSTEMD_ERROR_LOAD_FAILED;
}

// True if the daemon has to be reloaded before it can see the unit file.
static bool needsDaemonReload(ServiceManager &manager,
                              const std::string &name) {
  try {
    const UnitProperties props = manager.getUnitProperties(name);
    fprintf(stderr, "systemd: NeedDaemonReload %s\n",
            props.isTrue("NeedDaemonReload") ? "true" : "false");
    return props.stringEquals("LoadState", "not-found") ||
           props.isTrue("NeedDaemonReload");
  } catch (const BusCallError &e) {
    fprintf(stderr, "systemd: error while checking unit state %s: %s\n",
            name.c_str(), e.what());
    return false;
  }
}

std::string startAndEnableUnit(ServiceManager &manager,
                               const std::string &name,
                               const std::string &path,
                               const std::string &mode) {
  try {
    return manager.startUnit(name, mode);
  } catch (const BusCallError &e) {
    if (!isNoSuchUnit(e) && !isLoadFailed(e)) {
      throw;
    }
  }

  if (access(path.c_str(), F_OK) != 0) {
    throw BusCallError(SYSTEMD_ERROR_NO_SUCH_UNIT,
                       _s("Unit file not found: ") + path);
  }
  manager.enableUnitFiles(std::vector<std::string>{path}, false, true);
  if (needsDaemonReload(manager, name)) {
    fprintf(stderr, "systemd: Reloading daemon\n");
    try {
      manager.reload();
    } catch (const BusCallError &e) {
      fprintf(stderr,
              "systemd: Contents changed on disk and reload failed, "
              "subsequent start will likely fail: %s\n",
              e.what());
    }
  }
  return manager.startUnit(name, mode);
}
