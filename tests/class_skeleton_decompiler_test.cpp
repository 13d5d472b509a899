#include "classfile/class_file.hpp"
#include "decompiler/class_skeleton_decompiler.hpp"
#include "jar_decompiler.hpp"
#include "loader/class_cache.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace test_support;

namespace {

void add(ClassCache& cache, const std::string& name, const std::string& bytes) {
    std::istringstream input(bytes);
    cache.add_class(name, input);
}

ClassFileBuilder widget() {
    ClassFileBuilder builder("com/acme/Widget", "com/acme/Base", ACC_PUBLIC | ACC_SUPER);
    builder.add_interface("java/lang/Runnable")
        .add_interface("java/io/Serializable")
        .set_source_file("Widget.java")
        .add_long_constant(1234567890123LL)
        .add_field(ACC_PRIVATE, "count", "I")
        .add_field(ACC_PUBLIC | ACC_STATIC | ACC_FINAL, "NAMES", "[Ljava/lang/String;")
        .add_field(ACC_FINAL | ACC_SYNTHETIC, "this$0", "Lcom/acme/Outer;")
        .add_method(ACC_STATIC, "<clinit>", "()V")
        .add_method(ACC_PUBLIC, "<init>", "(ILjava/util/List;)V")
        .add_method(ACC_PUBLIC, "run", "()V")
        .add_method(ACC_PROTECTED | ACC_VARARGS, "format",
                    "(Ljava/lang/String;[Ljava/lang/Object;)Ljava/lang/String;", {"java/io/IOException"})
        .add_method(ACC_PUBLIC | ACC_NATIVE, "peek", "(J)[B")
        .add_method(ACC_PUBLIC | ACC_BRIDGE | ACC_SYNTHETIC, "bridge", "()Ljava/lang/Object;")
        .add_inner_class("com/acme/Widget$Part", "com/acme/Widget", "Part", ACC_PUBLIC | ACC_STATIC)
        .add_inner_class("com/acme/Widget$1", "", "", 0);
    return builder;
}

ClassFileBuilder widget_part() {
    ClassFileBuilder builder("com/acme/Widget$Part", "java/lang/Object", ACC_PUBLIC | ACC_SUPER);
    builder.add_field(ACC_PUBLIC, "weight", "D")
        .add_method(ACC_PUBLIC, "<init>", "()V")
        .add_inner_class("com/acme/Widget$Part", "com/acme/Widget", "Part", ACC_PUBLIC | ACC_STATIC);
    return builder;
}

} // namespace

TEST(ClassFileTest, ParsesDeclarations) {
    auto class_file = ClassFile::parse(widget().build());

    EXPECT_EQ(class_file->major_version(), 52);
    EXPECT_EQ(class_file->class_name(), "com/acme/Widget");
    EXPECT_EQ(class_file->super_class_name(), "com/acme/Base");
    EXPECT_EQ(class_file->interfaces(), (std::vector<std::string>{"java/lang/Runnable", "java/io/Serializable"}));
    EXPECT_EQ(class_file->source_file(), "Widget.java");
    ASSERT_EQ(class_file->fields().size(), 3u);
    EXPECT_EQ(class_file->fields()[1].descriptor, "[Ljava/lang/String;");
    ASSERT_EQ(class_file->methods().size(), 6u);
    EXPECT_EQ(class_file->methods()[3].exceptions, std::vector<std::string>{"java/io/IOException"});
    ASSERT_EQ(class_file->inner_classes().size(), 2u);
    EXPECT_EQ(class_file->inner_classes()[0].inner_name, "Part");
    EXPECT_TRUE(class_file->inner_classes()[1].outer_class.empty());
}

TEST(ClassFileTest, RejectsMalformedInput) {
    std::vector<uint8_t> bytes = widget().build();

    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] = 0x00;
    EXPECT_THROW(ClassFile::parse(bad_magic), ClassFormatException);

    std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + bytes.size() / 2);
    EXPECT_THROW(ClassFile::parse(truncated), ClassFormatException);

    EXPECT_THROW(ClassFile::parse({}), ClassFormatException);
}

TEST(ClassSkeletonDecompilerTest, RendersClassWithMemberClass) {
    ClassCache cache;
    add(cache, "com/acme/Widget", widget().build_string());
    add(cache, "com/acme/Widget$Part", widget_part().build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    std::string source = decompiler.decompile_class(cache, "com/acme/Widget");

    EXPECT_EQ(source,
              "// Source File: Widget.java\n"
              "// Class Version: 52.0\n"
              "package com.acme;\n"
              "\n"
              "public class Widget extends com.acme.Base implements Runnable, java.io.Serializable {\n"
              "\n"
              "    private int count;\n"
              "    public static final String[] NAMES;\n"
              "\n"
              "    static { /* compiled code */ }\n"
              "\n"
              "    public Widget(int arg0, java.util.List arg1) { /* compiled code */ }\n"
              "\n"
              "    public void run() { /* compiled code */ }\n"
              "\n"
              "    protected String format(String arg0, Object... arg1) throws java.io.IOException { /* compiled code */ }\n"
              "\n"
              "    public native byte[] peek(long arg0);\n"
              "\n"
              "    public static class Part {\n"
              "\n"
              "        public double weight;\n"
              "\n"
              "        public Part() { /* compiled code */ }\n"
              "    }\n"
              "}\n");
}

TEST(ClassSkeletonDecompilerTest, MissingMemberClassIsNoted) {
    ClassCache cache;
    add(cache, "com/acme/Widget", widget().build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    std::string source = decompiler.decompile_class(cache, "com/acme/Widget");

    EXPECT_NE(source.find("    // Member class com/acme/Widget$Part is not in this archive\n"), std::string::npos);
    EXPECT_EQ(source.find("class Part"), std::string::npos);
}

TEST(ClassSkeletonDecompilerTest, SelfReferentialMemberClassIsRenderedOnce) {
    ClassCache cache;
    ClassFileBuilder looping("A");
    looping.add_inner_class("A", "A", "M0", ACC_PUBLIC | ACC_STATIC)
        .add_inner_class("A", "A", "M1", ACC_PUBLIC | ACC_STATIC)
        .add_inner_class("A", "A", "M2", ACC_PUBLIC | ACC_STATIC);
    add(cache, "A", looping.build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    EXPECT_EQ(decompiler.decompile_class(cache, "A"),
              "// Class Version: 52.0\n"
              "\n"
              "public class A {\n"
              "\n"
              "    // Member class A is already declared\n"
              "\n"
              "    // Member class A is already declared\n"
              "\n"
              "    // Member class A is already declared\n"
              "}\n");
}

TEST(ClassSkeletonDecompilerTest, MemberClassCycleIsCut) {
    ClassCache cache;
    ClassFileBuilder outer("Outer");
    outer.add_inner_class("Outer$In", "Outer", "In", ACC_PUBLIC)
        .add_inner_class("Outer$In", "Outer", "In", ACC_PUBLIC);
    ClassFileBuilder inner("Outer$In");
    inner.add_inner_class("Outer", "Outer$In", "Back", ACC_PUBLIC)
        .add_inner_class("Outer$In", "Outer$In", "Self", ACC_PUBLIC);
    add(cache, "Outer", outer.build_string());
    add(cache, "Outer$In", inner.build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    EXPECT_EQ(decompiler.decompile_class(cache, "Outer"),
              "// Class Version: 52.0\n"
              "\n"
              "public class Outer {\n"
              "\n"
              "    public class In {\n"
              "\n"
              "        // Member class Outer is already declared\n"
              "\n"
              "        // Member class Outer$In is already declared\n"
              "    }\n"
              "\n"
              "    // Member class Outer$In is already declared\n"
              "}\n");
}

TEST(ClassSkeletonDecompilerTest, RendersInterface) {
    ClassCache cache;
    ClassFileBuilder shape("com/acme/Shape", "java/lang/Object", ACC_PUBLIC | ACC_INTERFACE | ACC_ABSTRACT);
    shape.add_interface("java/lang/Comparable")
        .add_method(ACC_PUBLIC | ACC_ABSTRACT, "area", "()D")
        .add_method(ACC_PUBLIC, "describe", "()Ljava/lang/String;")
        .add_method(ACC_PUBLIC | ACC_STATIC, "unit", "()Lcom/acme/Shape;");
    add(cache, "com/acme/Shape", shape.build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    EXPECT_EQ(decompiler.decompile_class(cache, "com/acme/Shape"),
              "// Class Version: 52.0\n"
              "package com.acme;\n"
              "\n"
              "public interface Shape extends Comparable {\n"
              "\n"
              "    double area();\n"
              "\n"
              "    default String describe() { /* compiled code */ }\n"
              "\n"
              "    static com.acme.Shape unit() { /* compiled code */ }\n"
              "}\n");
}

TEST(ClassSkeletonDecompilerTest, RendersEnumAndDefaultPackage) {
    ClassCache cache;
    ClassFileBuilder color("Color", "java/lang/Enum", ACC_PUBLIC | ACC_FINAL | ACC_SUPER | ACC_ENUM);
    color.add_field(ACC_PUBLIC | ACC_STATIC | ACC_FINAL | ACC_ENUM, "RED", "LColor;");
    add(cache, "Color", color.build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    EXPECT_EQ(decompiler.decompile_class(cache, "Color"),
              "// Class Version: 52.0\n"
              "\n"
              "public enum Color {\n"
              "\n"
              "    public static final Color RED;\n"
              "}\n");
}

TEST(ClassSkeletonDecompilerTest, FailuresBecomeDecompileExceptions) {
    ClassCache cache;
    add(cache, "Garbage", "definitely not bytecode");
    ClassFileBuilder bad_descriptor("BadField");
    bad_descriptor.add_field(ACC_PUBLIC, "x", "Q");
    add(cache, "BadField", bad_descriptor.build_string());

    ClassSkeletonDecompiler decompiler{DecompilerOptions()};
    EXPECT_THROW(decompiler.decompile_class(cache, "Garbage"), DecompileException);
    EXPECT_THROW(decompiler.decompile_class(cache, "BadField"), DecompileException);
    EXPECT_THROW(decompiler.decompile_class(cache, "NotCached"), DecompileException);
}

TEST(JarDecompilerTest, DecompilesArchiveIntoDirectory) {
    ScopedTempDir dir;
    ScopedTempDir staging;

    auto archive = dir / "app.jar";
    write_zip(archive, {
        {"com/", ""},
        {"com/acme/", ""},
        {"com/acme/Widget.class", widget().build_string()},
        {"com/acme/Widget$Part.class", widget_part().build_string()},
        {"com/acme/broken.class", "junk"},
        {"META-INF/MANIFEST.MF", "Manifest-Version: 1.0\n"},
        {"lib/dep.jar", zip_bytes({{"dep/Dep.class", ClassFileBuilder("dep/Dep").build_string()}})},
    });

    DecompilerOptions options;
    options.input_file = archive.string();
    options.output_directory = (dir / "out").string();
    options.decompile_inner_jars = true;
    options.temp_directory = staging.path().string();

    JarDecompiler decompiler(options);
    EXPECT_FALSE(decompiler.decompile());
    EXPECT_EQ(decompiler.result().status, PipelineStatus::completed_with_errors);
    EXPECT_EQ(decompiler.result().failed_classes, 1u);

    std::vector<std::string> expected{
        "META-INF/MANIFEST.MF",
        "com/acme/Widget.java",
        "lib/dep.jar.src/dep/Dep.java",
    };
    EXPECT_EQ(list_files(dir / "out"), expected);
    EXPECT_NE(read_file(dir / "out" / "com/acme/Widget.java").find("public static class Part {"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_empty(staging.path()));
}

TEST(JarDecompilerTest, DefaultOutputDirectoryIsNextToInput) {
    ScopedTempDir dir;
    auto archive = dir / "small.jar";
    write_zip(archive, {{"Main.class", ClassFileBuilder("Main").build_string()}});

    DecompilerOptions options;
    options.input_file = archive.string();

    JarDecompiler decompiler(options);
    EXPECT_TRUE(decompiler.decompile());
    EXPECT_EQ(list_files(dir / "small.jar.src"), std::vector<std::string>{"Main.java"});
}

TEST(JarDecompilerTest, UnreadableArchiveFails) {
    ScopedTempDir dir;
    auto archive = dir / "text.jar";
    write_file(archive, "not an archive");

    DecompilerOptions options;
    options.input_file = archive.string();
    options.output_directory = (dir / "out").string();

    JarDecompiler decompiler(options);
    EXPECT_FALSE(decompiler.decompile());
    EXPECT_EQ(decompiler.result().status, PipelineStatus::archive_open_failed);
}
