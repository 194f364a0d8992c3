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


#pragma once

#include "connection.hpp"
#include <map>

// Client of the systemd service manager, `org.freedesktop.systemd1.Manager`.
// https://www.freedesktop.org/wiki/Software/systemd/dbus/
//
// The methods throw `BusCallError` if systemd replies with an error, and
// `ObjectCastError` if the reply doesn't have the documented signature.

extern const char* const SYSTEMD_ERROR_NO_SUCH_UNIT;
extern const char* const SYSTEMD_ERROR_LOAD_FAILED;

// A row of the reply to ListUnits.
struct UnitStatus {
  std::string name;
  std::string description;
  std::string loadState;   // "loaded", "not-found", ...
  std::string activeState; // "active", "inactive", "failed", ...
  std::string subState;
  std::string followed;    // Unit which this unit follows, or empty
  std::string path;        // Object path of the unit
  uint32_t jobId;          // 0 if there is no queued job
  std::string jobType;
  std::string jobPath;
};

// A change made by EnableUnitFiles or DisableUnitFiles.
struct UnitFileChange {
  std::string type;        // "symlink" or "unlink"
  std::string filename;
  std::string destination;
};

struct EnableUnitFilesResult {
  bool carriesInstallInfo;
  std::vector<UnitFileChange> changes;
};

// A property of a transient unit, like ("Description", "s" value).
struct UnitProperty {
  std::string name;
  std::unique_ptr<DBusObject> value;
};

// The properties of a unit, keyed by name. The values are owned by the
// reply body, which is kept alive by this object.
class UnitProperties final {
  std::unique_ptr<DBusMessageBody> body_;
  std::map<std::string, const DBusObject*> values_;

public:
  // `body` is the reply to GetAll, with signature a{sv}.
  explicit UnitProperties(std::unique_ptr<DBusMessageBody>&& body);

  // Returns null if there is no such property.
  const DBusObject* find(const std::string& name) const;

  // True if the property exists and is the string `value`.
  bool stringEquals(const std::string& name, const std::string& value) const;

  // True if the property exists and is the boolean true.
  bool isTrue(const std::string& name) const;

  size_t size() const { return values_.size(); }
};

class ServiceManager final {
  BusConnection& conn_; // Not owned

  std::unique_ptr<DBusMessageBody> callManager(
    const std::string& member, const DBusMessageBody& body
  );

  // The unit lifecycle methods all have the signature (ss) -> o.
  std::string callUnitJob(
    const std::string& member, const std::string& name, const std::string& mode
  );

public:
  explicit ServiceManager(BusConnection& conn) : conn_(conn) {}

  // Returns the object path of the unit.
  std::string loadUnit(const std::string& name);

  // The following return the object path of the queued job. `mode` is
  // one of "replace", "fail", "isolate", "ignore-dependencies" or
  // "ignore-requirements".
  std::string startUnit(const std::string& name, const std::string& mode);
  std::string stopUnit(const std::string& name, const std::string& mode);
  std::string reloadUnit(const std::string& name, const std::string& mode);
  std::string restartUnit(const std::string& name, const std::string& mode);
  std::string tryRestartUnit(const std::string& name, const std::string& mode);
  std::string reloadOrRestartUnit(
    const std::string& name, const std::string& mode
  );
  std::string reloadOrTryRestartUnit(
    const std::string& name, const std::string& mode
  );

  std::string startTransientUnit(
    const std::string& name,
    const std::string& mode,
    std::vector<UnitProperty>&& properties
  );

  // Send `signal` to all the processes of the unit.
  void killUnit(const std::string& name, int32_t signal);

  // All the properties of the `org.freedesktop.systemd1.Unit` interface of
  // the unit, read with `org.freedesktop.DBus.Properties.GetAll`.
  UnitProperties getUnitProperties(const std::string& name);

  std::vector<UnitStatus> listUnits();

  EnableUnitFilesResult enableUnitFiles(
    const std::vector<std::string>& files, bool runtime, bool force
  );

  std::vector<UnitFileChange> disableUnitFiles(
    const std::vector<std::string>& files, bool runtime
  );

  // Ask systemd to send signals about unit and job changes.
  void subscribe();
  void unsubscribe();

  // Reload the configuration of the daemon.
  void reload();
};

// The object path of a unit: "/org/freedesktop/systemd1/unit/" followed by
// the unit name, with every byte which is not a letter or digit escaped
// as "_xx". For example, "foo.service" becomes "foo_2eservice".
std::string unitObjectPath(const std::string& name);

bool isNoSuchUnit(const BusCallError& e);
bool isLoadFailed(const BusCallError& e);

// Start the unit. If systemd doesn't know the unit, enable the unit file
// at `path`, reload the daemon if needed, and try again. Throws a
// `BusCallError` for NoSuchUnit if the unit file doesn't exist.
std::string startAndEnableUnit(
  ServiceManager& manager,
  const std::string& name,
  const std::string& path,
  const std::string& mode
);
