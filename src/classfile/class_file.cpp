#include "class_file.hpp"
#include <utility>

// Big-endian cursor over the class file bytes; every read is bounds checked.
class ClassFile::Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {}

    uint8_t u1() {
        require(1);
        return data_[offset_++];
    }

    uint16_t u2() {
        require(2);
        uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t u4() {
        require(4);
        uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 24) |
                         (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                         (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                         static_cast<uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return value;
    }

    std::string bytes(std::size_t count) {
        require(count);
        std::string value(reinterpret_cast<const char*>(data_.data() + offset_), count);
        offset_ += count;
        return value;
    }

    void skip(std::size_t count) {
        require(count);
        offset_ += count;
    }

    std::size_t offset() const { return offset_; }

private:
    void require(std::size_t count) const {
        if (count > data_.size() - offset_) {
            throw ClassFormatException("Truncated class file at offset " + std::to_string(offset_));
        }
    }

    const std::vector<uint8_t>& data_;
    std::size_t offset_;
};

std::unique_ptr<ClassFile> ClassFile::parse(const std::vector<uint8_t>& data) {
    Reader reader(data);

    if (reader.u4() != CLASS_FILE_MAGIC) {
        throw ClassFormatException("Bad class file magic");
    }

    auto class_file = std::unique_ptr<ClassFile>(new ClassFile());
    class_file->minor_version_ = reader.u2();
    class_file->major_version_ = reader.u2();

    class_file->parse_constant_pool(reader);

    class_file->access_flags_ = reader.u2();
    class_file->class_name_ = class_file->get_class_name(reader.u2());

    uint16_t super_index = reader.u2();
    if (super_index != 0) {
        class_file->super_class_name_ = class_file->get_class_name(super_index);
    }

    uint16_t interfaces_count = reader.u2();
    for (uint16_t i = 0; i < interfaces_count; ++i) {
        class_file->interfaces_.push_back(class_file->get_class_name(reader.u2()));
    }

    class_file->parse_members(reader, class_file->fields_, false);
    class_file->parse_members(reader, class_file->methods_, true);
    class_file->parse_class_attributes(reader);

    return class_file;
}

void ClassFile::parse_constant_pool(Reader& reader) {
    uint16_t count = reader.u2();
    if (count == 0) {
        throw ClassFormatException("Empty constant pool");
    }
    constant_pool_.resize(count);

    for (uint32_t i = 1; i < count; ++i) {
        ConstantPoolEntry& entry = constant_pool_[i];
        entry.tag = reader.u1();

        switch (entry.tag) {
            case CONSTANT_Utf8:
                entry.utf8 = reader.bytes(reader.u2());
                break;
            case CONSTANT_Integer:
            case CONSTANT_Float:
                reader.skip(4);
                break;
            case CONSTANT_Long:
            case CONSTANT_Double:
                // Eight-byte constants take two pool slots
                if (i + 1 >= count) {
                    throw ClassFormatException("Eight-byte constant in last pool slot " + std::to_string(i));
                }
                reader.skip(8);
                ++i;
                break;
            case CONSTANT_Class:
            case CONSTANT_String:
            case CONSTANT_MethodType:
            case CONSTANT_Module:
            case CONSTANT_Package:
                entry.index1 = reader.u2();
                break;
            case CONSTANT_Fieldref:
            case CONSTANT_Methodref:
            case CONSTANT_InterfaceMethodref:
            case CONSTANT_NameAndType:
            case CONSTANT_Dynamic:
            case CONSTANT_InvokeDynamic:
                entry.index1 = reader.u2();
                entry.index2 = reader.u2();
                break;
            case CONSTANT_MethodHandle:
                entry.index1 = reader.u1();
                entry.index2 = reader.u2();
                break;
            default:
                throw ClassFormatException("Unknown constant pool tag " + std::to_string(entry.tag) +
                                           " at index " + std::to_string(i));
        }
    }
}

void ClassFile::parse_members(Reader& reader, std::vector<ClassMember>& members, bool is_method) {
    uint16_t count = reader.u2();
    members.reserve(count);

    for (uint16_t i = 0; i < count; ++i) {
        ClassMember member;
        member.access_flags = reader.u2();
        member.name = get_utf8(reader.u2());
        member.descriptor = get_utf8(reader.u2());

        uint16_t attributes_count = reader.u2();
        for (uint16_t a = 0; a < attributes_count; ++a) {
            const std::string& attribute_name = get_utf8(reader.u2());
            uint32_t length = reader.u4();

            if (is_method && attribute_name == "Exceptions") {
                std::size_t end = reader.offset() + length;
                uint16_t exception_count = reader.u2();
                for (uint16_t e = 0; e < exception_count; ++e) {
                    member.exceptions.push_back(get_class_name(reader.u2()));
                }
                if (reader.offset() != end) {
                    throw ClassFormatException("Exceptions attribute length mismatch in " + member.name);
                }
            } else {
                reader.skip(length);
            }
        }

        members.push_back(std::move(member));
    }
}

void ClassFile::parse_class_attributes(Reader& reader) {
    uint16_t attributes_count = reader.u2();
    for (uint16_t a = 0; a < attributes_count; ++a) {
        const std::string& attribute_name = get_utf8(reader.u2());
        uint32_t length = reader.u4();

        if (attribute_name == "SourceFile" && length == 2) {
            source_file_ = get_utf8(reader.u2());
        } else if (attribute_name == "InnerClasses") {
            std::size_t end = reader.offset() + length;
            parse_inner_classes(reader);
            if (reader.offset() != end) {
                throw ClassFormatException("InnerClasses attribute length mismatch");
            }
        } else {
            reader.skip(length);
        }
    }
}

void ClassFile::parse_inner_classes(Reader& reader) {
    uint16_t count = reader.u2();
    for (uint16_t i = 0; i < count; ++i) {
        InnerClassInfo info;
        info.inner_class = get_class_name(reader.u2());

        uint16_t outer_index = reader.u2();
        if (outer_index != 0) {
            info.outer_class = get_class_name(outer_index);
        }

        uint16_t name_index = reader.u2();
        if (name_index != 0) {
            info.inner_name = get_utf8(name_index);
        }

        info.access_flags = reader.u2();
        inner_classes_.push_back(std::move(info));
    }
}

const ConstantPoolEntry& ClassFile::constant(uint16_t index, uint8_t expected_tag) const {
    if (index == 0 || index >= constant_pool_.size()) {
        throw ClassFormatException("Constant pool index out of range: " + std::to_string(index));
    }
    const ConstantPoolEntry& entry = constant_pool_[index];
    if (entry.tag != expected_tag) {
        throw ClassFormatException("Constant pool entry " + std::to_string(index) + " has tag " +
                                   std::to_string(entry.tag) + ", expected " + std::to_string(expected_tag));
    }
    return entry;
}

const std::string& ClassFile::get_utf8(uint16_t index) const {
    return constant(index, CONSTANT_Utf8).utf8;
}

std::string ClassFile::get_class_name(uint16_t index) const {
    return get_utf8(constant(index, CONSTANT_Class).index1);
}
