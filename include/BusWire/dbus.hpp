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

#include "error.hpp"
#include "parse.hpp"
#include <functional>
#include <vector>

// This file contains the primitive codec: the D-Bus type system
// (`DBusType`) and the values of those types (`DBusObject`). Types know
// how to build a parser for their values, and values know how to
// serialize themselves.
// https://dbus.freedesktop.org/doc/dbus-specification.html#type-system

class Serializer {
public:
  Serializer() {}
  virtual ~Serializer() {}

  virtual void writeByte(char c) = 0;
  virtual void writeBytes(const char* buf, size_t bufsize) = 0;
  virtual void writeUint16(uint16_t x) = 0;
  virtual void writeUint32(uint32_t x) = 0;
  virtual void writeUint64(uint64_t x) = 0;
  virtual void writeDouble(double d) = 0;

  // Insert padding bytes until the position is at the next multiple
  // of `alignment`. The alignment must be a power of 2.
  virtual void insertPadding(size_t alignment) = 0;

  // Number of bytes serialized so far.
  virtual size_t getPos() const = 0;

  // Arrays are prefixed with their size in bytes, which isn't known
  // until the elements have been serialized. `f` receives the size
  // recorded on an earlier pass and returns the actual size.
  virtual void recordArraySize(const std::function<uint32_t(uint32_t)>& f) = 0;
};

// Interface for pretty printing.
class Printer {
public:
  virtual ~Printer() {}

  virtual void printChar(char c) = 0;
  virtual void printUint8(uint8_t x) = 0;
  virtual void printInt8(int8_t x) = 0;
  virtual void printUint16(uint16_t x) = 0;
  virtual void printInt16(int16_t x) = 0;
  virtual void printUint32(uint32_t x) = 0;
  virtual void printInt32(int32_t x) = 0;
  virtual void printUint64(uint64_t x) = 0;
  virtual void printInt64(int64_t x) = 0;
  virtual void printDouble(double x) = 0;
  virtual void printString(const std::string& str) = 0;
  virtual void printNewline(size_t indent) = 0;
};

class DBusType;
class DBusTypeChar;
class DBusTypeBoolean;
class DBusTypeUint16;
class DBusTypeInt16;
class DBusTypeUint32;
class DBusTypeInt32;
class DBusTypeUint64;
class DBusTypeInt64;
class DBusTypeDouble;
class DBusTypeUnixFD;
class DBusTypeString;
class DBusTypePath;
class DBusTypeSignature;
class DBusTypeVariant;
class DBusTypeDictEntry;
class DBusTypeArray;
class DBusTypeStruct;

class DBusTypeStorage;

class DBusObject;
class DBusObjectChar;
class DBusObjectBoolean;
class DBusObjectUint16;
class DBusObjectInt16;
class DBusObjectUint32;
class DBusObjectInt32;
class DBusObjectUint64;
class DBusObjectInt64;
class DBusObjectDouble;
class DBusObjectUnixFD;
class DBusObjectString;
class DBusObjectPath;
class DBusObjectSignature;
class DBusObjectVariant;
class DBusObjectDictEntry;
class DBusObjectArray;
class DBusObjectStruct;

class DBusType {
public:
  // Visitor interface
  class Visitor {
  public:
    virtual ~Visitor() {}
    virtual void visit(const DBusTypeChar&) = 0;
    virtual void visit(const DBusTypeBoolean&) = 0;
    virtual void visit(const DBusTypeUint16&) = 0;
    virtual void visit(const DBusTypeInt16&) = 0;
    virtual void visit(const DBusTypeUint32&) = 0;
    virtual void visit(const DBusTypeInt32&) = 0;
    virtual void visit(const DBusTypeUint64&) = 0;
    virtual void visit(const DBusTypeInt64&) = 0;
    virtual void visit(const DBusTypeDouble&) = 0;
    virtual void visit(const DBusTypeUnixFD&) = 0;
    virtual void visit(const DBusTypeString&) = 0;
    virtual void visit(const DBusTypePath&) = 0;
    virtual void visit(const DBusTypeSignature&) = 0;
    virtual void visit(const DBusTypeVariant&) = 0;
    virtual void visit(const DBusTypeDictEntry&) = 0;
    virtual void visit(const DBusTypeArray&) = 0;
    virtual void visit(const DBusTypeStruct&) = 0;
  };

  // Continuation for parsing a type.
  class ParseTypeCont {
  public:
    virtual ~ParseTypeCont() {}
    virtual std::unique_ptr<Parse::Cont> parse(
      DBusTypeStorage& typeStorage, // Type allocator
      const Parse::State& p,
      const DBusType& t
    ) = 0;
    virtual std::unique_ptr<Parse::Cont> parseCloseParen(
      DBusTypeStorage& typeStorage, // Type allocator
      const Parse::State& p
    ) = 0;
  };

  // Continuation for parsing an object of this type.
  template <Endianness endianness>
  class ParseObjectCont {
  public:
    virtual ~ParseObjectCont() {}
    virtual std::unique_ptr<Parse::Cont> parse(
      const Parse::State& p, std::unique_ptr<DBusObject>&& obj
    ) = 0;
  };

  virtual ~DBusType() {}

  // When D-Bus objects are serialized, they are aligned. For example
  // a UINT32 is 32-bit aligned and a STRUCT is 64-bit aligned. This
  // corresponds to the alignment column of this table:
  // https://dbus.freedesktop.org/doc/dbus-specification.html#idm694
  virtual size_t alignment() const = 0;

  // Write the signature of the type.
  virtual void serialize(Serializer& s) const = 0;

  // The signature of the type, for example "a{sv}".
  std::string toString() const;

  // Create a parser for this type. The parameter is a continuation
  // function, which will receive the `DBusObject` which was parsed.
  // This method uses the template method design pattern to delegate
  // most of the work to `mkObjectParserImpl` (below). But this
  // wrapper takes care of alignment.
  template <Endianness endianness>
  std::unique_ptr<Parse::Cont> mkObjectParser(
    const Parse::State& p,
    std::unique_ptr<ParseObjectCont<endianness>>&& cont
  ) const;

  virtual void accept(Visitor& visitor) const = 0;

protected:
  // Little endian parser.
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<LittleEndian>>&& cont
  ) const = 0;

  // Big endian parser.
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<BigEndian>>&& cont
  ) const = 0;
};

// Base class of the types which don't have any parameters: all the basic
// types, plus variant. `sig` is the type code in a signature. The parsers
// are defined in dbus_parse.cpp, which explicitly instantiates this
// template for every leaf type.
template <class Derived, char sig, size_t align>
class DBusTypeLeaf : public DBusType {
public:
  // Leaf types are constant, so this instance is available for anyone
  // to use.
  static const Derived instance_;

  static constexpr char signatureChar = sig;

  virtual size_t alignment() const final override { return align; }

  virtual void serialize(Serializer& s) const final override {
    s.writeByte(sig);
  }

  virtual void accept(Visitor& visitor) const final override {
    visitor.visit(static_cast<const Derived&>(*this));
  }

protected:
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<LittleEndian>>&& cont
  ) const final override;

  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<BigEndian>>&& cont
  ) const final override;
};

template <class Derived, char sig, size_t align>
const Derived DBusTypeLeaf<Derived, sig, align>::instance_;

class DBusTypeChar final
  : public DBusTypeLeaf<DBusTypeChar, 'y', sizeof(char)> {};

// D-Bus Booleans are 32 bits.
class DBusTypeBoolean final
  : public DBusTypeLeaf<DBusTypeBoolean, 'b', sizeof(uint32_t)> {};

class DBusTypeUint16 final
  : public DBusTypeLeaf<DBusTypeUint16, 'q', sizeof(uint16_t)> {};

class DBusTypeInt16 final
  : public DBusTypeLeaf<DBusTypeInt16, 'n', sizeof(int16_t)> {};

class DBusTypeUint32 final
  : public DBusTypeLeaf<DBusTypeUint32, 'u', sizeof(uint32_t)> {};

class DBusTypeInt32 final
  : public DBusTypeLeaf<DBusTypeInt32, 'i', sizeof(int32_t)> {};

class DBusTypeUint64 final
  : public DBusTypeLeaf<DBusTypeUint64, 't', sizeof(uint64_t)> {};

class DBusTypeInt64 final
  : public DBusTypeLeaf<DBusTypeInt64, 'x', sizeof(int64_t)> {};

class DBusTypeDouble final
  : public DBusTypeLeaf<DBusTypeDouble, 'd', sizeof(double)> {};

// The value is an index into the out-of-band array of file descriptors.
class DBusTypeUnixFD final
  : public DBusTypeLeaf<DBusTypeUnixFD, 'h', sizeof(uint32_t)> {};

// Strings and paths are aligned for their 32-bit length prefix.
class DBusTypeString final
  : public DBusTypeLeaf<DBusTypeString, 's', sizeof(uint32_t)> {};

class DBusTypePath final
  : public DBusTypeLeaf<DBusTypePath, 'o', sizeof(uint32_t)> {};

// The length of a signature fits in a char.
class DBusTypeSignature final
  : public DBusTypeLeaf<DBusTypeSignature, 'g', sizeof(char)> {};

// A serialized variant starts with a signature, which has a 1-byte
// alignment.
class DBusTypeVariant final
  : public DBusTypeLeaf<DBusTypeVariant, 'v', sizeof(char)> {};

class DBusTypeDictEntry : public DBusType {
  // Reference to the key type which is not owned by this class.
  const DBusType& keyType_;

  // Reference to the value type which is not owned by this class.
  const DBusType& valueType_;

public:
  // We keep references to `keyType` and `valueType`, but do not take
  // ownership of them.
  DBusTypeDictEntry(const DBusType& keyType, const DBusType& valueType) :
    keyType_(keyType), valueType_(valueType)
  {}

  const DBusType& getKeyType() const { return keyType_; }
  const DBusType& getValueType() const { return valueType_; }

  virtual size_t alignment() const final override {
    return sizeof(uint64_t); // Same as DBusTypeStruct
  }

  virtual void serialize(Serializer& s) const final override {
    s.writeByte('{');
    keyType_.serialize(s);
    valueType_.serialize(s);
    s.writeByte('}');
  }

  virtual void accept(Visitor& visitor) const final override {
    visitor.visit(*this);
  }

protected:
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<LittleEndian>>&& cont
  ) const final override;

  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<BigEndian>>&& cont
  ) const final override;
};

class DBusTypeArray : public DBusType {
  // Reference to the base type which is not owned by this class.
  const DBusType& baseType_;

public:
  // We keep a reference to the baseType, but do not take ownership of it.
  explicit DBusTypeArray(const DBusType& baseType) : baseType_(baseType) {}

  const DBusType& getBaseType() const { return baseType_; }

  virtual size_t alignment() const final override {
    return sizeof(uint32_t); // For the length
  }

  virtual void serialize(Serializer& s) const final override {
    s.writeByte('a');
    baseType_.serialize(s);
  }

  virtual void accept(Visitor& visitor) const final override {
    visitor.visit(*this);
  }

protected:
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<LittleEndian>>&& cont
  ) const final override;

  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<BigEndian>>&& cont
  ) const final override;
};

class DBusTypeStruct : public DBusType {
  // The vector of field types is owned by this class, but it contains
  // references to types which we do not own.
  const std::vector<std::reference_wrapper<const DBusType>> fieldTypes_;

public:
  // We take ownership of the vector, but not the field types which it
  // references.
  explicit DBusTypeStruct(
    std::vector<std::reference_wrapper<const DBusType>>&& fieldTypes
  ) :
    fieldTypes_(std::move(fieldTypes))
  {}

  const std::vector<std::reference_wrapper<const DBusType>>&
  getFieldTypes() const {
    return fieldTypes_;
  }

  virtual size_t alignment() const final override {
    return sizeof(uint64_t);
  }

  virtual void serialize(Serializer& s) const final override {
    s.writeByte('(');
    for (const DBusType& i: fieldTypes_) {
      i.serialize(s);
    }
    s.writeByte(')');
  }

  virtual void accept(Visitor& visitor) const final override {
    visitor.visit(*this);
  }

protected:
  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<LittleEndian>>&& cont
  ) const final override;

  virtual std::unique_ptr<Parse::Cont> mkObjectParserImpl(
    const Parse::State& p, std::unique_ptr<ParseObjectCont<BigEndian>>&& cont
  ) const final override;
};

// `DBusType` uses references to refer to sub-types, because the type is
// usually embedded in a `DBusObject`. Types which are not embedded in an
// object, like the types parsed from a signature or the element type of
// an empty array, are allocated here. Leaf types have a global constant
// instance, so only dict entry, array and struct types are allocated.
// Each kind is kept in a singly linked list.
class DBusTypeStorage final {
  template <class T>
  class Link final : public T {
    const std::unique_ptr<Link> next_;

  public:
    template <class... Args>
    Link(std::unique_ptr<Link>&& next, Args&&... args) :
      T(std::forward<Args>(args)...),
      next_(std::move(next))
    {}
  };

  std::unique_ptr<Link<DBusTypeArray>> arrays_;
  std::unique_ptr<Link<DBusTypeDictEntry>> dict_entries_;
  std::unique_ptr<Link<DBusTypeStruct>> structs_;

public:
  DBusTypeStorage() {}

  const DBusTypeArray& allocArray(const DBusType& baseType) {
    arrays_ = std::make_unique<Link<DBusTypeArray>>(
      std::move(arrays_), baseType
    );
    return *arrays_;
  }

  const DBusTypeDictEntry& allocDictEntry(
    const DBusType& keyType, const DBusType& valueType
  ) {
    dict_entries_ = std::make_unique<Link<DBusTypeDictEntry>>(
      std::move(dict_entries_), keyType, valueType
    );
    return *dict_entries_;
  }

  const DBusTypeStruct& allocStruct(
    std::vector<std::reference_wrapper<const DBusType>>&& fieldTypes
  ) {
    structs_ = std::make_unique<Link<DBusTypeStruct>>(
      std::move(structs_), std::move(fieldTypes)
    );
    return *structs_;
  }
};

class ObjectCastError : public Error {
public:
  explicit ObjectCastError(const std::string& actual) :
    Error(std::string("ObjectCastError: unexpected object of type ") + actual)
  {}
};

class DBusObject {
public:
  // Visitor interface
  class Visitor {
  public:
    virtual ~Visitor() {}
    virtual void visit(const DBusObjectChar&) = 0;
    virtual void visit(const DBusObjectBoolean&) = 0;
    virtual void visit(const DBusObjectUint16&) = 0;
    virtual void visit(const DBusObjectInt16&) = 0;
    virtual void visit(const DBusObjectUint32&) = 0;
    virtual void visit(const DBusObjectInt32&) = 0;
    virtual void visit(const DBusObjectUint64&) = 0;
    virtual void visit(const DBusObjectInt64&) = 0;
    virtual void visit(const DBusObjectDouble&) = 0;
    virtual void visit(const DBusObjectUnixFD&) = 0;
    virtual void visit(const DBusObjectString&) = 0;
    virtual void visit(const DBusObjectPath&) = 0;
    virtual void visit(const DBusObjectSignature&) = 0;
    virtual void visit(const DBusObjectVariant&) = 0;
    virtual void visit(const DBusObjectDictEntry&) = 0;
    virtual void visit(const DBusObjectArray&) = 0;
    virtual void visit(const DBusObjectStruct&) = 0;
  };

  DBusObject() {}
  virtual ~DBusObject() = default;

  virtual const DBusType& getType() const = 0;

  // Always call serializePadding before calling this method.
  virtual void serializeAfterPadding(Serializer& s) const = 0;

  virtual void print(Printer& p, size_t indent) const = 0;

  virtual void accept(Visitor& visitor) const = 0;

  // Downcast to one of the concrete object classes, for example
  // `obj.as<DBusObjectString>()`. Throws `ObjectCastError` if the object
  // has a different type.
  template <class T>
  const T& as() const {
    const T* result = dynamic_cast<const T*>(this);
    if (!result) {
      throw ObjectCastError(getType().toString());
    }
    return *result;
  }

  void print(Printer& p) const {
    print(p, 0);
    p.printNewline(0);
  }

  void serialize(Serializer& s) const {
    s.insertPadding(getType().alignment());
    serializeAfterPadding(s);
  }

  size_t serializedSize() const;
};

// Base class of the objects whose type is a leaf type. `T` is the C++
// type used to store the value.
template <class Derived, class Type, class T>
class DBusObjectLeaf : public DBusObject {
  const T x_;

public:
  explicit DBusObjectLeaf(T x) : x_(std::move(x)) {}

  static std::unique_ptr<Derived> mk(T x) {
    return std::make_unique<Derived>(std::move(x));
  }

  virtual const DBusType& getType() const final override {
    return Type::instance_;
  }

  virtual void accept(Visitor& visitor) const final override {
    visitor.visit(static_cast<const Derived&>(*this));
  }

  const T& getValue() const { return x_; }
};

class DBusObjectChar final
  : public DBusObjectLeaf<DBusObjectChar, DBusTypeChar, char> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeByte(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectBoolean final
  : public DBusObjectLeaf<DBusObjectBoolean, DBusTypeBoolean, bool> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint32(static_cast<uint32_t>(getValue()));
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectUint16 final
  : public DBusObjectLeaf<DBusObjectUint16, DBusTypeUint16, uint16_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint16(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectInt16 final
  : public DBusObjectLeaf<DBusObjectInt16, DBusTypeInt16, int16_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint16(static_cast<uint16_t>(getValue()));
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectUint32 final
  : public DBusObjectLeaf<DBusObjectUint32, DBusTypeUint32, uint32_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint32(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectInt32 final
  : public DBusObjectLeaf<DBusObjectInt32, DBusTypeInt32, int32_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint32(static_cast<uint32_t>(getValue()));
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectUint64 final
  : public DBusObjectLeaf<DBusObjectUint64, DBusTypeUint64, uint64_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint64(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectInt64 final
  : public DBusObjectLeaf<DBusObjectInt64, DBusTypeInt64, int64_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint64(static_cast<uint64_t>(getValue()));
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectDouble final
  : public DBusObjectLeaf<DBusObjectDouble, DBusTypeDouble, double> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeDouble(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

// Note: the value is not a file descriptor. It is an index into
// an array of file descriptors, which is passed out-of-band.
class DBusObjectUnixFD final
  : public DBusObjectLeaf<DBusObjectUnixFD, DBusTypeUnixFD, uint32_t> {
public:
  using DBusObjectLeaf::DBusObjectLeaf;

  virtual void serializeAfterPadding(Serializer& s) const override {
    s.writeUint32(getValue());
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectString final
  : public DBusObjectLeaf<DBusObjectString, DBusTypeString, std::string> {
public:
  explicit DBusObjectString(std::string str);

  virtual void serializeAfterPadding(Serializer& s) const override {
    const uint32_t len = getValue().size();
    s.writeUint32(len);
    s.writeBytes(getValue().c_str(), len+1);
  }

  virtual void print(Printer& p, size_t) const override;
};

class DBusObjectPath final
  : public DBusObjectLeaf<DBusObjectPath, DBusTypePath, std::string> {
public:
  explicit DBusObjectPath(std::string str);

  virtual void serializeAfterPadding(Serializer& s) const override {
    const uint32_t len = getValue().size();
    s.writeUint32(len);
    s.writeBytes(getValue().c_str(), len+1);
  }

  virtual void print(Printer& p, size_t) const override;
};

// Almost identical to DBusObjectString and DBusObjectPath, except that a
// single byte is used to serialize the length. (The maximum length of a
// signature is 255.)
class DBusObjectSignature final
  : public DBusObjectLeaf<DBusObjectSignature, DBusTypeSignature, std::string> {
public:
  explicit DBusObjectSignature(std::string str);

  virtual void serializeAfterPadding(Serializer& s) const override {
    const uint8_t len = getValue().size();
    s.writeByte(len);
    s.writeBytes(getValue().c_str(), len+1);
  }

  virtual void print(Printer& p, size_t) const override;

  // Parse the sequence of types from the signature string. You need to
  // supply a `DBusTypeStorage` so that the parser can allocate new
  // types. The return value of the function contains references (into the
  // `DBusTypeStorage` object), so you need to make sure that the storage
  // doesn't get deallocated until you are finished with the types.
  std::vector<std::reference_wrapper<const DBusType>> toTypes(
    DBusTypeStorage& typeStorage // Type allocator
  ) const;
};

class DBusObjectVariant final : public DBusObject {
  const std::unique_ptr<DBusObject> object_;
  const DBusObjectSignature signature_;

public:
  explicit DBusObjectVariant(std::unique_ptr<DBusObject>&& object);

  static std::unique_ptr<DBusObjectVariant> mk(
    std::unique_ptr<DBusObject>&& object
  ) {
    return std::make_unique<DBusObjectVariant>(std::move(object));
  }

  virtual const DBusType& getType() const override {
    return DBusTypeVariant::instance_;
  }

  virtual void serializeAfterPadding(Serializer& s) const override {
    signature_.serialize(s);
    object_->serialize(s);
  }

  virtual void print(Printer& p, size_t indent) const override;

  virtual void accept(Visitor& visitor) const override {
    visitor.visit(*this);
  }

  const std::unique_ptr<DBusObject>& getValue() const { return object_; }
};

class DBusObjectDictEntry : public DBusObject {
  const std::unique_ptr<DBusObject> key_;
  const std::unique_ptr<DBusObject> value_;
  const DBusTypeDictEntry dictEntryType_;

public:
  DBusObjectDictEntry(
    std::unique_ptr<DBusObject>&& key,
    std::unique_ptr<DBusObject>&& value
  );

  static std::unique_ptr<DBusObjectDictEntry> mk(
    std::unique_ptr<DBusObject>&& key,
    std::unique_ptr<DBusObject>&& value
  ) {
    return std::make_unique<DBusObjectDictEntry>(
      std::move(key), std::move(value)
    );
  }

  virtual const DBusType& getType() const final override {
    return dictEntryType_;
  }

  virtual void serializeAfterPadding(Serializer& s) const final override {
    key_->serialize(s);
    value_->serialize(s);
  }

  virtual void print(Printer& p, size_t indent) const override final;

  virtual void accept(Visitor& visitor) const override {
    visitor.visit(*this);
  }

  const std::unique_ptr<DBusObject>& getKey() const { return key_; }
  const std::unique_ptr<DBusObject>& getValue() const { return value_; }
};

class DBusObjectSeq final {
  const std::vector<std::unique_ptr<DBusObject>> elements_;

public:
  explicit DBusObjectSeq(std::vector<std::unique_ptr<DBusObject>>&& elements);

  size_t length() const { return elements_.size(); }

  std::vector<std::reference_wrapper<const DBusType>> elementTypes() const {
    std::vector<std::reference_wrapper<const DBusType>> types;
    types.reserve(elements_.size());
    for (auto& element : elements_) {
      types.push_back(std::cref(element->getType()));
    }
    return types;
  }

  void print(Printer& p, size_t indent, char lbracket, char rbracket) const;

  void serialize(Serializer& s) const {
    for (auto& p: elements_) {
      p->serialize(s);
    }
  }

  const std::unique_ptr<DBusObject>& getElement(size_t i) const {
    return elements_.at(i);
  }
};

class DBusObjectArray : public DBusObject {
  const DBusObjectSeq seq_;

  // Note: this type contains a reference to the base type of the array
  // type. It doesn't own the base type, so we need to make sure that it
  // cannot become a dangling pointer. That's easy when the array has
  // at least one element because we can just make it a reference to the
  // type of element zero. But if there are zero elements, then we need
  // to make sure that we own the base type. This problem is solved by
  // DBusObjectArray0, which owns any struct or array types that are used
  // in the base type.
  const DBusTypeArray arrayType_;

public:
  // DBusObjectArray keeps a reference to baseType, so the
  // lifetime of baseType must exceed that of the DBusObjectArray.
  DBusObjectArray(
    const DBusType& baseType,
    std::vector<std::unique_ptr<DBusObject>>&& elements
  );

  // Constructing an array with zero elements needs to be handled as
  // a special case to avoid the `arrayType_` field containing a dangling
  // pointer. See the comment on `arrayType_`.
  static std::unique_ptr<DBusObjectArray> mk0(const DBusType& baseType);

  // If the number of elements is non-zero, then we can deduce the base type
  // from the zero'th element.
  static std::unique_ptr<DBusObjectArray> mk1(
    std::vector<std::unique_ptr<DBusObject>>&& elements
  ) {
    return std::make_unique<DBusObjectArray>(
      elements.at(0)->getType(), std::move(elements)
    );
  }

  static std::unique_ptr<DBusObjectArray> mk(
    const DBusType& baseType,
    std::vector<std::unique_ptr<DBusObject>>&& elements
  ) {
    if (elements.size() == 0) {
      return mk0(baseType);
    } else {
      return mk1(std::move(elements));
    }
  }

  virtual const DBusType& getType() const final override { return arrayType_; }

  virtual void serializeAfterPadding(Serializer& s) const final override {
    s.recordArraySize(
      [this, &s](uint32_t arraySize) {
        s.writeUint32(arraySize);
        s.insertPadding(arrayType_.getBaseType().alignment());
        const size_t posBefore = s.getPos();
        seq_.serialize(s);
        return static_cast<uint32_t>(s.getPos() - posBefore);
      }
    );
  }

  virtual void print(Printer& p, size_t indent) const override final;

  virtual void accept(Visitor& visitor) const override {
    visitor.visit(*this);
  }

  size_t numElements() const { return seq_.length(); }

  const std::unique_ptr<DBusObject>& getElement(size_t i) const {
    return seq_.getElement(i);
  }
};

class DBusObjectArray0 final : public DBusObjectArray {
  DBusTypeStorage typeStorage_;

public:
  DBusObjectArray0(
    const DBusType& baseType,
    std::vector<std::unique_ptr<DBusObject>>&& elements,
    DBusTypeStorage&& typeStorage
  );
};

class DBusObjectStruct : public DBusObject {
  const DBusObjectSeq seq_;
  const DBusTypeStruct structType_;

public:
  explicit DBusObjectStruct(std::vector<std::unique_ptr<DBusObject>>&& elements);

  static std::unique_ptr<DBusObjectStruct> mk(
    std::vector<std::unique_ptr<DBusObject>>&& elements
  ) {
    return std::make_unique<DBusObjectStruct>(std::move(elements));
  }

  virtual const DBusType& getType() const final override { return structType_; }

  virtual void serializeAfterPadding(Serializer& s) const final override {
    seq_.serialize(s);
  }

  virtual void print(Printer& p, size_t indent) const override final;

  virtual void accept(Visitor& visitor) const override {
    visitor.visit(*this);
  }

  size_t numFields() const { return seq_.length(); }

  const std::unique_ptr<DBusObject>& getElement(size_t i) const {
    return seq_.getElement(i);
  }
};

// The arguments of a message. The body is not a D-Bus value in its own
// right: its signature is the concatenation of the element signatures
// and it is serialized without any enclosing container.
class DBusMessageBody {
  const DBusObjectSeq seq_;

public:
  explicit DBusMessageBody(std::vector<std::unique_ptr<DBusObject>>&& elements);

  // Create an empty message body.
  static std::unique_ptr<DBusMessageBody> mk0();

  // Create a message body with 1 element.
  static std::unique_ptr<DBusMessageBody> mk1(
    std::unique_ptr<DBusObject>&& element
  );

  // Create a message body with multiple elements.
  static std::unique_ptr<DBusMessageBody> mk(
    std::vector<std::unique_ptr<DBusObject>>&& elements
  );

  // Parse the bytes of a message body, using the types in `signature`.
  // Throws `ParseError` if the bytes do not match the signature exactly.
  static std::unique_ptr<DBusMessageBody> parse(
    Endianness endianness,
    const std::string& signature,
    const char* buf,
    size_t bufsize
  );

  std::string signature() const;

  void serialize(Serializer& s) const;

  size_t serializedSize() const;

  void print(Printer& p, size_t indent) const;

  size_t numElements() const { return seq_.length(); }

  const std::unique_ptr<DBusObject>& getElement(size_t i) const {
    return seq_.getElement(i);
  }
};

// Utility for downcasting to std::unique_ptr<DBusObject>.
inline std::unique_ptr<DBusObject> _obj(std::unique_ptr<DBusObject>&& o) {
  return std::unique_ptr<DBusObject>(std::move(o));
}

// Make a deep copy of the type. Leaf types are not copied because they
// have a global constant instance. Dict entry, array and struct types
// are allocated in `typeStorage`.
const DBusType& cloneType(
  DBusTypeStorage& typeStorage, // Type allocator
  const DBusType& t
);
