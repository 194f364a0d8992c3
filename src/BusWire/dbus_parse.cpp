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

// Look up the leaf type which has signature character `c`. Returns
// nullptr if `c` is not the signature of a leaf type.
template <class... Ts> static const DBusType *findLeafType(char c) {
  const DBusType *result = nullptr;
  (void)((c == Ts::signatureChar ? (result = &Ts::instance_, true) : false) ||
         ...);
  return result;
}

static const DBusType *leafTypeFromChar(char c) {
  return findLeafType<DBusTypeChar, DBusTypeBoolean, DBusTypeUint16,
                      DBusTypeInt16, DBusTypeUint32, DBusTypeInt32,
                      DBusTypeUint64, DBusTypeInt64, DBusTypeDouble,
                      DBusTypeUnixFD, DBusTypeString, DBusTypePath,
                      DBusTypeSignature, DBusTypeVariant>(c);
}

static std::unique_ptr<Parse::Cont>
parseType(DBusTypeStorage &typeStorage, // Type allocator
          std::unique_ptr<DBusType::ParseTypeCont> &&cont) {
  // Base class for the continuations which can't accept a close paren.
  class ContNoParen : public DBusType::ParseTypeCont {
    const char *const context_;

  public:
    explicit ContNoParen(const char *context) : context_(context) {}

    std::unique_ptr<Parse::Cont> parseCloseParen(DBusTypeStorage &,
                                                 const Parse::State &p) final {
      throw ParseError(p.getPos(),
                       _s("Unexpected close paren while parsing ") + context_);
    }
  };

  class ContDictCloseBrace final : public ParseChar::Cont {
    DBusTypeStorage &typeStorage_; // Not owned
    const DBusType &keyType_;
    const DBusType &valueType_;
    const std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    ContDictCloseBrace(DBusTypeStorage &typeStorage, const DBusType &keyType,
                       const DBusType &valueType,
                       std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : typeStorage_(typeStorage), keyType_(keyType), valueType_(valueType),
          cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       char c) override {
      if (c != '}') {
        throw ParseError(p.getPos() - 1, "Expected a '}' character.");
      }
      return cont_->parse(typeStorage_, p,
                          typeStorage_.allocDictEntry(keyType_, valueType_));
    }
  };

  class ContDictValue final : public ContNoParen {
    const DBusType &keyType_;
    std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    ContDictValue(const DBusType &keyType,
                  std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : ContNoParen("dict entry type."), keyType_(keyType),
          cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &typeStorage,
                                       const Parse::State &,
                                       const DBusType &valueType) override {
      return ParseChar::mk(std::make_unique<ContDictCloseBrace>(
          typeStorage, keyType_, valueType, std::move(cont_)));
    }
  };

  class ContDictKey final : public ContNoParen {
    std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    explicit ContDictKey(std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : ContNoParen("dict entry type."), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &typeStorage,
                                       const Parse::State &,
                                       const DBusType &keyType) override {
      return parseType(typeStorage, std::make_unique<ContDictValue>(
                                        keyType, std::move(cont_)));
    }
  };

  class ContStruct final : public DBusType::ParseTypeCont {
    std::vector<std::reference_wrapper<const DBusType>> fieldTypes_;
    std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    ContStruct(std::vector<std::reference_wrapper<const DBusType>> &&fieldTypes,
               std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : fieldTypes_(std::move(fieldTypes)), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &typeStorage,
                                       const Parse::State &,
                                       const DBusType &t) override {
      fieldTypes_.push_back(t);
      return parseType(typeStorage,
                       std::make_unique<ContStruct>(std::move(fieldTypes_),
                                                    std::move(cont_)));
    }

    std::unique_ptr<Parse::Cont>
    parseCloseParen(DBusTypeStorage &typeStorage,
                    const Parse::State &p) override {
      if (fieldTypes_.empty()) {
        throw ParseError(p.getPos() - 1, "Empty struct type.");
      }
      return cont_->parse(typeStorage, p,
                          typeStorage.allocStruct(std::move(fieldTypes_)));
    }
  };

  class ContArray final : public ContNoParen {
    const std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    explicit ContArray(std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : ContNoParen("array type."), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &typeStorage,
                                       const Parse::State &p,
                                       const DBusType &t) override {
      return cont_->parse(typeStorage, p, typeStorage.allocArray(t));
    }
  };

  class Cont final : public ParseChar::Cont {
    DBusTypeStorage &typeStorage_; // Not owned
    std::unique_ptr<DBusType::ParseTypeCont> cont_;

  public:
    Cont(DBusTypeStorage &typeStorage, // Type allocator
         std::unique_ptr<DBusType::ParseTypeCont> &&cont)
        : typeStorage_(typeStorage), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       char c) override {
      if (const DBusType *leaf = leafTypeFromChar(c)) {
        return cont_->parse(typeStorage_, p, *leaf);
      }
      switch (c) {
      case 'a':
        return parseType(typeStorage_,
                         std::make_unique<ContArray>(std::move(cont_)));
      case '(':
        return parseType(
            typeStorage_,
            std::make_unique<ContStruct>(
                std::vector<std::reference_wrapper<const DBusType>>(),
                std::move(cont_)));
      case ')':
        return cont_->parseCloseParen(typeStorage_, p);
      case '{':
        return parseType(typeStorage_,
                         std::make_unique<ContDictKey>(std::move(cont_)));
      default:
        throw ParseError(p.getPos() - 1, _s("Invalid type character: ") +
                                             std::to_string(int(c)));
      }
    }
  };

  return ParseChar::mk(std::make_unique<Cont>(typeStorage, std::move(cont)));
}

// Utility for parsing the correct number of alignment bytes.
static std::unique_ptr<Parse::Cont>
parseAlignment(const Parse::State &p, const DBusType &t,
               std::unique_ptr<ParseZeros::Cont> &&cont) {
  return ParseZeros::mk(p, paddingFor(p.getPos(), t.alignment()),
                        std::move(cont));
}

template <Endianness endianness>
std::unique_ptr<Parse::Cont> DBusType::mkObjectParser(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<endianness>> &&cont) const {
  class PaddingCont final : public ParseZeros::Cont {
    const DBusType &t_;
    std::unique_ptr<ParseObjectCont<endianness>> cont_;

  public:
    PaddingCont(const DBusType &t,
                std::unique_ptr<ParseObjectCont<endianness>> &&cont)
        : t_(t), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      return t_.mkObjectParserImpl(p, std::move(cont_));
    }
  };

  return parseAlignment(p, *this,
                        std::make_unique<PaddingCont>(*this, std::move(cont)));
}

template std::unique_ptr<Parse::Cont> DBusType::mkObjectParser(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<LittleEndian>> &&cont) const;

template std::unique_ptr<Parse::Cont> DBusType::mkObjectParser(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<BigEndian>> &&cont) const;

// Parser for the fixed-width leaf types. `Raw` is the unsigned integer
// which holds the wire representation of an `Obj`.
template <Endianness endianness, class Obj, class Raw>
static std::unique_ptr<Parse::Cont>
parseFixed(std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class Cont final : public ParseUint<Raw, endianness>::Cont {
    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    explicit Cont(std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       Raw x) override {
      typedef std::decay_t<decltype(std::declval<Obj>().getValue())> T;
      if constexpr (std::is_same<T, bool>::value) {
        if (x > 1) {
          throw ParseError(p.getPos() - sizeof(Raw),
                           "Boolean value that is not 0 or 1.");
        }
        return cont_->parse(p, Obj::mk(x != 0));
      } else if constexpr (std::is_same<T, double>::value) {
        static_assert(sizeof(double) == sizeof(Raw));
        double d;
        memcpy(&d, &x, sizeof(d));
        return cont_->parse(p, Obj::mk(d));
      } else {
        return cont_->parse(p, Obj::mk(static_cast<T>(x)));
      }
    }
  };

  return ParseUint<Raw, endianness>::mk(
      std::make_unique<Cont>(std::move(cont)));
}

// Utility for parsing a string with a known length, followed by its
// terminating zero byte.
static std::unique_ptr<Parse::Cont>
parseString(const Parse::State &p, size_t len,
            std::unique_ptr<ParseNChars::Cont> &&cont) {
  class ZerosCont final : public ParseZeros::Cont {
    std::string str_;
    const std::unique_ptr<ParseNChars::Cont> cont_;

  public:
    ZerosCont(std::string &&str, std::unique_ptr<ParseNChars::Cont> &&cont)
        : str_(std::move(str)), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      return cont_->parse(p, std::move(str_));
    }
  };

  class StringCont final : public ParseNChars::Cont {
    std::unique_ptr<ParseNChars::Cont> cont_;

  public:
    explicit StringCont(std::unique_ptr<ParseNChars::Cont> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       std::string &&str) override {
      if (str.find('\0') != std::string::npos) {
        throw ParseError(p.getPos() - str.size() + str.find('\0'),
                         "Unexpected zero byte in string.");
      }
      return ParseZeros::mk(
          p, 1, std::make_unique<ZerosCont>(std::move(str), std::move(cont_)));
    }
  };

  return ParseNChars::mk(p, std::string(), len,
                         std::make_unique<StringCont>(std::move(cont)));
}

// Parser for the string-like leaf types. The length prefix is a
// `uint32_t` for strings and paths, but a single byte for signatures.
template <Endianness endianness, class Obj, class LengthParser, class Len>
static std::unique_ptr<Parse::Cont>
parseStringLike(std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class StrCont final : public ParseNChars::Cont {
    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    explicit StrCont(
        std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       std::string &&str) override {
      return cont_->parse(p, Obj::mk(std::move(str)));
    }
  };

  class LengthCont final : public LengthParser::Cont {
    std::unique_ptr<ParseNChars::Cont> cont_;

  public:
    explicit LengthCont(std::unique_ptr<ParseNChars::Cont> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       Len len) override {
      return parseString(p, static_cast<std::make_unsigned_t<Len>>(len),
                         std::move(cont_));
    }
  };

  return LengthParser::mk(std::make_unique<LengthCont>(
      std::make_unique<StrCont>(std::move(cont))));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeChar &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class Cont final : public ParseChar::Cont {
    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    explicit Cont(std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       char c) override {
      return cont_->parse(p, DBusObjectChar::mk(c));
    }
  };

  return ParseChar::mk(std::make_unique<Cont>(std::move(cont)));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeBoolean &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectBoolean, uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeUint16 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectUint16, uint16_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeInt16 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectInt16, uint16_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeUint32 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectUint32, uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeInt32 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectInt32, uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeUint64 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectUint64, uint64_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeInt64 &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectInt64, uint64_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeDouble &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectDouble, uint64_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeUnixFD &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseFixed<endianness, DBusObjectUnixFD, uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeString &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseStringLike<endianness, DBusObjectString,
                         ParseUint32<endianness>, uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypePath &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseStringLike<endianness, DBusObjectPath, ParseUint32<endianness>,
                         uint32_t>(std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeSignature &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  return parseStringLike<endianness, DBusObjectSignature, ParseChar, char>(
      std::move(cont));
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
mkLeafParser(const DBusTypeVariant &,
             std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class ObjectCont final : public DBusType::ParseObjectCont<endianness> {
    // The type of the value lives here until the value has been parsed.
    DBusTypeStorage typeStorage_;

    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    explicit ObjectCont(
        std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : cont_(std::move(cont)) {}

    DBusTypeStorage &getTypeStorage() { return typeStorage_; }

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&obj) override {
      return cont_->parse(p, DBusObjectVariant::mk(std::move(obj)));
    }
  };

  class ZerosCont final : public ParseZeros::Cont {
    const DBusType &t_;
    std::unique_ptr<ObjectCont> cont_;

  public:
    ZerosCont(const DBusType &t, std::unique_ptr<ObjectCont> &&cont)
        : t_(t), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      return t_.mkObjectParser<endianness>(p, std::move(cont_));
    }
  };

  class TypeCont final : public DBusType::ParseTypeCont {
    const size_t endpos_; // Byte position where the signature should end
    std::unique_ptr<ObjectCont> cont_;

  public:
    TypeCont(size_t endpos, std::unique_ptr<ObjectCont> &&cont)
        : endpos_(endpos), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &,
                                       const Parse::State &p,
                                       const DBusType &t) override {
      const size_t pos = p.getPos();
      if (pos != endpos_) {
        throw ParseError(pos, "Incorrect variant signature length.");
      }

      // Parse the terminating zero byte.
      return ParseZeros::mk(p, 1,
                            std::make_unique<ZerosCont>(t, std::move(cont_)));
    }

    std::unique_ptr<Parse::Cont>
    parseCloseParen(DBusTypeStorage &, const Parse::State &p) override {
      throw ParseError(
          p.getPos(),
          "Unexpected close paren while parsing variant signature.");
    }
  };

  class LengthCont final : public ParseChar::Cont {
    std::unique_ptr<ObjectCont> cont_;

  public:
    explicit LengthCont(std::unique_ptr<ObjectCont> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       char c) override {
      // A variant holds exactly one complete type, so the length is
      // only used to check the signature.
      const size_t endpos = p.getPos() + static_cast<uint8_t>(c);
      DBusTypeStorage &typeStorage = cont_->getTypeStorage();
      return parseType(typeStorage,
                       std::make_unique<TypeCont>(endpos, std::move(cont_)));
    }
  };

  return ParseChar::mk(std::make_unique<LengthCont>(
      std::make_unique<ObjectCont>(std::move(cont))));
}

template <class Derived, char sig, size_t align>
std::unique_ptr<Parse::Cont>
DBusTypeLeaf<Derived, sig, align>::mkObjectParserImpl(
    const Parse::State &,
    std::unique_ptr<ParseObjectCont<LittleEndian>> &&cont) const {
  return mkLeafParser(static_cast<const Derived &>(*this), std::move(cont));
}

template <class Derived, char sig, size_t align>
std::unique_ptr<Parse::Cont>
DBusTypeLeaf<Derived, sig, align>::mkObjectParserImpl(
    const Parse::State &,
    std::unique_ptr<ParseObjectCont<BigEndian>> &&cont) const {
  return mkLeafParser(static_cast<const Derived &>(*this), std::move(cont));
}

template class DBusTypeLeaf<DBusTypeChar, 'y', sizeof(char)>;
template class DBusTypeLeaf<DBusTypeBoolean, 'b', sizeof(uint32_t)>;
template class DBusTypeLeaf<DBusTypeUint16, 'q', sizeof(uint16_t)>;
template class DBusTypeLeaf<DBusTypeInt16, 'n', sizeof(int16_t)>;
template class DBusTypeLeaf<DBusTypeUint32, 'u', sizeof(uint32_t)>;
template class DBusTypeLeaf<DBusTypeInt32, 'i', sizeof(int32_t)>;
template class DBusTypeLeaf<DBusTypeUint64, 't', sizeof(uint64_t)>;
template class DBusTypeLeaf<DBusTypeInt64, 'x', sizeof(int64_t)>;
template class DBusTypeLeaf<DBusTypeDouble, 'd', sizeof(double)>;
template class DBusTypeLeaf<DBusTypeUnixFD, 'h', sizeof(uint32_t)>;
template class DBusTypeLeaf<DBusTypeString, 's', sizeof(uint32_t)>;
template class DBusTypeLeaf<DBusTypePath, 'o', sizeof(uint32_t)>;
template class DBusTypeLeaf<DBusTypeSignature, 'g', sizeof(char)>;
template class DBusTypeLeaf<DBusTypeVariant, 'v', sizeof(char)>;

template <Endianness endianness>
static std::unique_ptr<Parse::Cont> parseDictEntry(
    const Parse::State &p, const DBusType &keyType, const DBusType &valueType,
    std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class ValueCont final : public DBusType::ParseObjectCont<endianness> {
    std::unique_ptr<DBusObject> key_;
    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    ValueCont(std::unique_ptr<DBusObject> &&key,
              std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : key_(std::move(key)), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&value) override {
      return cont_->parse(
          p, DBusObjectDictEntry::mk(std::move(key_), std::move(value)));
    }
  };

  class KeyCont final : public DBusType::ParseObjectCont<endianness> {
    const DBusType &valueType_;
    std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    KeyCont(const DBusType &valueType,
            std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : valueType_(valueType), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&key) override {
      return valueType_.mkObjectParser<endianness>(
          p, std::make_unique<ValueCont>(std::move(key), std::move(cont_)));
    }
  };

  return keyType.mkObjectParser<endianness>(
      p, std::make_unique<KeyCont>(valueType, std::move(cont)));
}

std::unique_ptr<Parse::Cont> DBusTypeDictEntry::mkObjectParserImpl(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<LittleEndian>> &&cont) const {
  return parseDictEntry(p, keyType_, valueType_, std::move(cont));
}

std::unique_ptr<Parse::Cont> DBusTypeDictEntry::mkObjectParserImpl(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<BigEndian>> &&cont) const {
  return parseDictEntry(p, keyType_, valueType_, std::move(cont));
}

// Parse array elements until the byte position reaches `endpos`.
template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
parseArrayElements(const Parse::State &p, const DBusType &elemType,
                   size_t endpos,
                   std::vector<std::unique_ptr<DBusObject>> &&elements,
                   std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class Cont final : public DBusType::ParseObjectCont<endianness> {
    const DBusType &elemType_;
    const size_t endpos_;
    std::vector<std::unique_ptr<DBusObject>> elements_;
    std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    Cont(const DBusType &elemType, size_t endpos,
         std::vector<std::unique_ptr<DBusObject>> &&elements,
         std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : elemType_(elemType), endpos_(endpos), elements_(std::move(elements)),
          cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&obj) override {
      elements_.push_back(std::move(obj));
      return parseArrayElements(p, elemType_, endpos_, std::move(elements_),
                                std::move(cont_));
    }
  };

  const size_t pos = p.getPos();
  if (pos < endpos) {
    return elemType.mkObjectParser<endianness>(
        p, std::make_unique<Cont>(elemType, endpos, std::move(elements),
                                  std::move(cont)));
  } else if (pos == endpos) {
    return cont->parse(p, DBusObjectArray::mk(elemType, std::move(elements)));
  } else {
    throw ParseError(pos, "Incorrect array length.");
  }
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
parseArray(const DBusType &elemType,
           std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  // The array length doesn't include the padding before the first
  // element.
  class PaddingCont final : public ParseZeros::Cont {
    const DBusType &elemType_;
    const uint32_t len_;
    std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    PaddingCont(const DBusType &elemType, uint32_t len,
                std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : elemType_(elemType), len_(len), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      const size_t pos = p.getPos();
      size_t endpos = 0;
      if (__builtin_add_overflow(pos, len_, &endpos)) {
        throw ParseError(pos, "Array length integer overflow.");
      }
      return parseArrayElements(p, elemType_, endpos,
                                std::vector<std::unique_ptr<DBusObject>>(),
                                std::move(cont_));
    }
  };

  class LengthCont final : public ParseUint32<endianness>::Cont {
    const DBusType &elemType_;
    std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    LengthCont(const DBusType &elemType,
               std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : elemType_(elemType), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       uint32_t len) override {
      return parseAlignment(
          p, elemType_,
          std::make_unique<PaddingCont>(elemType_, len, std::move(cont_)));
    }
  };

  return ParseUint32<endianness>::mk(
      std::make_unique<LengthCont>(elemType, std::move(cont)));
}

std::unique_ptr<Parse::Cont> DBusTypeArray::mkObjectParserImpl(
    const Parse::State &,
    std::unique_ptr<ParseObjectCont<LittleEndian>> &&cont) const {
  return parseArray(baseType_, std::move(cont));
}

std::unique_ptr<Parse::Cont> DBusTypeArray::mkObjectParserImpl(
    const Parse::State &,
    std::unique_ptr<ParseObjectCont<BigEndian>> &&cont) const {
  return parseArray(baseType_, std::move(cont));
}

// Continuation argument to parseObjects. It collects the objects as they
// are parsed.
template <Endianness endianness> class ParseObjectsCont {
protected:
  std::vector<std::unique_ptr<DBusObject>> objects_;

public:
  virtual ~ParseObjectsCont() {}

  void addObject(std::unique_ptr<DBusObject> &&obj) {
    objects_.push_back(std::move(obj));
  }

  virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p) = 0;
};

// Parse a sequence of objects, starting at `types[i]`.
template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
parseObjects(const Parse::State &p,
             const std::vector<std::reference_wrapper<const DBusType>> &types,
             size_t i, std::unique_ptr<ParseObjectsCont<endianness>> &&cont) {
  class Cont final : public DBusType::ParseObjectCont<endianness> {
    const std::vector<std::reference_wrapper<const DBusType>> &types_;
    const size_t i_;
    std::unique_ptr<ParseObjectsCont<endianness>> cont_;

  public:
    Cont(const std::vector<std::reference_wrapper<const DBusType>> &types,
         size_t i, std::unique_ptr<ParseObjectsCont<endianness>> &&cont)
        : types_(types), i_(i), cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&obj) override {
      cont_->addObject(std::move(obj));
      return parseObjects(p, types_, i_ + 1, std::move(cont_));
    }
  };

  if (i < types.size()) {
    const DBusType &t = types[i];
    return t.mkObjectParser<endianness>(
        p, std::make_unique<Cont>(types, i, std::move(cont)));
  } else {
    return cont->parse(p);
  }
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
parseStruct(const Parse::State &p, const DBusTypeStruct &structType,
            std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont) {
  class Cont final : public ParseObjectsCont<endianness> {
    const std::unique_ptr<DBusType::ParseObjectCont<endianness>> cont_;

  public:
    explicit Cont(std::unique_ptr<DBusType::ParseObjectCont<endianness>> &&cont)
        : cont_(std::move(cont)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      return cont_->parse(p, DBusObjectStruct::mk(std::move(this->objects_)));
    }
  };

  return parseObjects<endianness>(p, structType.getFieldTypes(), 0,
                                  std::make_unique<Cont>(std::move(cont)));
}

std::unique_ptr<Parse::Cont> DBusTypeStruct::mkObjectParserImpl(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<LittleEndian>> &&cont) const {
  return parseStruct(p, *this, std::move(cont));
}

std::unique_ptr<Parse::Cont> DBusTypeStruct::mkObjectParserImpl(
    const Parse::State &p,
    std::unique_ptr<ParseObjectCont<BigEndian>> &&cont) const {
  return parseStruct(p, *this, std::move(cont));
}

std::vector<std::reference_wrapper<const DBusType>>
DBusObjectSignature::toTypes(DBusTypeStorage &typeStorage // Type allocator
) const {
  class TypeCont final : public DBusType::ParseTypeCont {
    const size_t endpos_;
    std::vector<std::reference_wrapper<const DBusType>> &result_;

  public:
    TypeCont(size_t endpos,
             std::vector<std::reference_wrapper<const DBusType>> &result)
        : endpos_(endpos), result_(result) {}

    std::unique_ptr<Parse::Cont> parse(DBusTypeStorage &typeStorage,
                                       const Parse::State &p,
                                       const DBusType &t) override {
      result_.push_back(t);
      if (p.getPos() < endpos_) {
        return parseType(typeStorage,
                         std::make_unique<TypeCont>(endpos_, result_));
      } else {
        return ParseStop::mk();
      }
    }

    std::unique_ptr<Parse::Cont>
    parseCloseParen(DBusTypeStorage &, const Parse::State &p) override {
      throw ParseError(p.getPos() - 1,
                       "Unexpected close paren while parsing signature.");
    }
  };

  std::vector<std::reference_wrapper<const DBusType>> result;
  const std::string &sig = getValue();
  if (sig.empty()) {
    return result;
  }
  Parse p(parseType(typeStorage,
                    std::make_unique<TypeCont>(sig.size(), result)));
  p.parseBuffer(sig.c_str(), sig.size());
  return result;
}

template <Endianness endianness>
static std::unique_ptr<DBusMessageBody>
parseBody(const std::vector<std::reference_wrapper<const DBusType>> &types,
          const char *buf, size_t bufsize) {
  class BodyCont final : public ParseObjectsCont<endianness> {
    std::unique_ptr<DBusMessageBody> &result_;

  public:
    explicit BodyCont(std::unique_ptr<DBusMessageBody> &result)
        : result_(result) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &) override {
      result_ = DBusMessageBody::mk(std::move(this->objects_));
      return ParseStop::mk();
    }
  };

  // The body starts on an 8-byte boundary, so counting positions from
  // the start of the body gives the same alignment as counting from the
  // start of the message.
  std::unique_ptr<DBusMessageBody> result;
  Parse p(parseObjects<endianness>(Parse::State::initialState_, types, 0,
                                   std::make_unique<BodyCont>(result)));
  p.parseBuffer(buf, bufsize);
  return result;
}

std::unique_ptr<DBusMessageBody>
DBusMessageBody::parse(Endianness endianness, const std::string &signature,
                       const char *buf, size_t bufsize) {
  if (signature.size() > 0xFF) {
    throw ParseError(0, "Body signature is too long.");
  }
  // The parsed objects own their types, so the storage is only needed
  // until the parse is complete.
  DBusTypeStorage typeStorage;
  const auto types = DBusObjectSignature(signature).toTypes(typeStorage);
  if (endianness == LittleEndian) {
    return parseBody<LittleEndian>(types, buf, bufsize);
  } else {
    return parseBody<BigEndian>(types, buf, bufsize);
  }
}
