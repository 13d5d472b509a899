#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Class file magic and constant pool tags (JVMS chapter 4)
constexpr uint32_t CLASS_FILE_MAGIC = 0xCAFEBABE;

enum ConstantTag : uint8_t {
    CONSTANT_Utf8 = 1,
    CONSTANT_Integer = 3,
    CONSTANT_Float = 4,
    CONSTANT_Long = 5,
    CONSTANT_Double = 6,
    CONSTANT_Class = 7,
    CONSTANT_String = 8,
    CONSTANT_Fieldref = 9,
    CONSTANT_Methodref = 10,
    CONSTANT_InterfaceMethodref = 11,
    CONSTANT_NameAndType = 12,
    CONSTANT_MethodHandle = 15,
    CONSTANT_MethodType = 16,
    CONSTANT_Dynamic = 17,
    CONSTANT_InvokeDynamic = 18,
    CONSTANT_Module = 19,
    CONSTANT_Package = 20
};

// Access flags
enum AccessFlags : uint16_t {
    ACC_PUBLIC = 0x0001,
    ACC_PRIVATE = 0x0002,
    ACC_PROTECTED = 0x0004,
    ACC_STATIC = 0x0008,
    ACC_FINAL = 0x0010,
    ACC_SUPER = 0x0020,
    ACC_SYNCHRONIZED = 0x0020,
    ACC_VOLATILE = 0x0040,
    ACC_BRIDGE = 0x0040,
    ACC_TRANSIENT = 0x0080,
    ACC_VARARGS = 0x0080,
    ACC_NATIVE = 0x0100,
    ACC_INTERFACE = 0x0200,
    ACC_ABSTRACT = 0x0400,
    ACC_STRICT = 0x0800,
    ACC_SYNTHETIC = 0x1000,
    ACC_ANNOTATION = 0x2000,
    ACC_ENUM = 0x4000,
    ACC_MODULE = 0x8000
};

struct ConstantPoolEntry {
    uint8_t tag = 0;        // 0 marks the unusable slot after a Long or Double
    std::string utf8;       // CONSTANT_Utf8 value
    uint16_t index1 = 0;    // name/class/descriptor index, depending on tag
    uint16_t index2 = 0;
};

struct ClassMember {
    uint16_t access_flags = 0;
    std::string name;
    std::string descriptor;
    std::vector<std::string> exceptions; // methods only, binary names
};

struct InnerClassInfo {
    std::string inner_class;  // binary name
    std::string outer_class;  // empty for local and anonymous classes
    std::string inner_name;   // empty for anonymous classes
    uint16_t access_flags = 0;
};
