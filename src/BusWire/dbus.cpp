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

#include "dbus.hpp"
#include "utils.hpp"
#include <assert.h>

static_assert(!std::is_polymorphic<DBusTypeStorage>::value,
              "DBusTypeStorage does not have any virtual methods");

DBusObjectString::DBusObjectString(std::string str)
    : DBusObjectLeaf(std::move(str)) {
  // String length must fit in a `uint32_t`.
  assert((getValue().size() >> 32) == 0);
}

DBusObjectPath::DBusObjectPath(std::string str)
    : DBusObjectLeaf(std::move(str)) {
  // Path length must fit in a `uint32_t`.
  assert((getValue().size() >> 32) == 0);
}

DBusObjectSignature::DBusObjectSignature(std::string str)
    : DBusObjectLeaf(std::move(str)) {
  // Signature length must fit in a `uint8_t`.
  assert((getValue().size() >> 8) == 0);
}

DBusObjectVariant::DBusObjectVariant(std::unique_ptr<DBusObject> &&object)
    : object_(std::move(object)), signature_(object_->getType().toString()) {}

DBusObjectDictEntry::DBusObjectDictEntry(std::unique_ptr<DBusObject> &&key,
                                         std::unique_ptr<DBusObject> &&value)
    : key_(std::move(key)), value_(std::move(value)),
      dictEntryType_(key_->getType(), value_->getType()) {}

DBusObjectSeq::DBusObjectSeq(
    std::vector<std::unique_ptr<DBusObject>> &&elements)
    : elements_(std::move(elements)) {}

DBusObjectArray::DBusObjectArray(
    const DBusType &baseType,
    std::vector<std::unique_ptr<DBusObject>> &&elements)
    : seq_(std::move(elements)), arrayType_(baseType) {}

DBusObjectArray0::DBusObjectArray0(
    const DBusType &baseType,
    std::vector<std::unique_ptr<DBusObject>> &&elements,
    DBusTypeStorage &&typeStorage)
    : DBusObjectArray(baseType, std::move(elements)),
      typeStorage_(std::move(typeStorage)) {}

std::unique_ptr<DBusObjectArray>
DBusObjectArray::mk0(const DBusType &baseType) {
  // The caller's base type may be temporary, so the array gets its own
  // copy. The copy is allocated in nodes which keep their address when
  // the storage is moved into the DBusObjectArray0.
  DBusTypeStorage typeStorage;
  const DBusType &newBaseType = cloneType(typeStorage, baseType);

  return std::make_unique<DBusObjectArray0>(
      newBaseType, std::vector<std::unique_ptr<DBusObject>>(),
      std::move(typeStorage));
}

DBusObjectStruct::DBusObjectStruct(
    std::vector<std::unique_ptr<DBusObject>> &&elements)
    : seq_(std::move(elements)), structType_(seq_.elementTypes()) {}

DBusMessageBody::DBusMessageBody(
    std::vector<std::unique_ptr<DBusObject>> &&elements)
    : seq_(std::move(elements)) {}

std::unique_ptr<DBusMessageBody> DBusMessageBody::mk0() {
  return std::make_unique<DBusMessageBody>(
      std::vector<std::unique_ptr<DBusObject>>());
}

std::unique_ptr<DBusMessageBody>
DBusMessageBody::mk1(std::unique_ptr<DBusObject> &&element) {
  return std::make_unique<DBusMessageBody>(_vec(std::move(element)));
}

std::unique_ptr<DBusMessageBody>
DBusMessageBody::mk(std::vector<std::unique_ptr<DBusObject>> &&elements) {
  return std::make_unique<DBusMessageBody>(std::move(elements));
}

const DBusType &cloneType(DBusTypeStorage &typeStorage, // Type allocator
                          const DBusType &t) {
  class CloneVisitor final : public DBusType::Visitor {
    DBusTypeStorage &typeStorage_; // Not owned
    const DBusType *result_;

  public:
    explicit CloneVisitor(DBusTypeStorage &typeStorage // Type allocator
                          )
        : typeStorage_(typeStorage), result_(nullptr) {}

    // Leaf types are not copied: the global instance is used instead.
    void visit(const DBusTypeChar &) override {
      result_ = &DBusTypeChar::instance_;
    }
    void visit(const DBusTypeBoolean &) override {
      result_ = &DBusTypeBoolean::instance_;
    }
    void visit(const DBusTypeUint16 &) override {
      result_ = &DBusTypeUint16::instance_;
    }
    void visit(const DBusTypeInt16 &) override {
      result_ = &DBusTypeInt16::instance_;
    }
    void visit(const DBusTypeUint32 &) override {
      result_ = &DBusTypeUint32::instance_;
    }
    void visit(const DBusTypeInt32 &) override {
      result_ = &DBusTypeInt32::instance_;
    }
    void visit(const DBusTypeUint64 &) override {
      result_ = &DBusTypeUint64::instance_;
    }
    void visit(const DBusTypeInt64 &) override {
      result_ = &DBusTypeInt64::instance_;
    }
    void visit(const DBusTypeDouble &) override {
      result_ = &DBusTypeDouble::instance_;
    }
    void visit(const DBusTypeUnixFD &) override {
      result_ = &DBusTypeUnixFD::instance_;
    }
    void visit(const DBusTypeString &) override {
      result_ = &DBusTypeString::instance_;
    }
    void visit(const DBusTypePath &) override {
      result_ = &DBusTypePath::instance_;
    }
    void visit(const DBusTypeSignature &) override {
      result_ = &DBusTypeSignature::instance_;
    }
    void visit(const DBusTypeVariant &) override {
      result_ = &DBusTypeVariant::instance_;
    }

    void visit(const DBusTypeDictEntry &t) override {
      const DBusType &keyType = cloneType(typeStorage_, t.getKeyType());
      const DBusType &valueType = cloneType(typeStorage_, t.getValueType());
      result_ = &typeStorage_.allocDictEntry(keyType, valueType);
    }

    void visit(const DBusTypeArray &t) override {
      const DBusType &baseType = cloneType(typeStorage_, t.getBaseType());
      result_ = &typeStorage_.allocArray(baseType);
    }

    void visit(const DBusTypeStruct &t) override {
      std::vector<std::reference_wrapper<const DBusType>> fieldTypes;
      fieldTypes.reserve(t.getFieldTypes().size());
      for (const DBusType &fieldType : t.getFieldTypes()) {
        fieldTypes.push_back(std::cref(cloneType(typeStorage_, fieldType)));
      }
      result_ = &typeStorage_.allocStruct(std::move(fieldTypes));
    }

    const DBusType &getResult() const { return *result_; }
  };

  CloneVisitor visitor(typeStorage);
  t.accept(visitor);
  return visitor.getResult();
}
