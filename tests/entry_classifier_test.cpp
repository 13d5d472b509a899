#include "input/entry_classifier.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

DecompilerOptions inner_jar_options() {
    DecompilerOptions options;
    options.decompile_inner_jars = true;
    return options;
}

} // namespace

TEST(EntryClassifierTest, ClassifiesByNameWithDefaults) {
    EntryClassifier classifier{DecompilerOptions()};

    EXPECT_EQ(classifier.classify("com/acme/Foo.class"), EntryCategory::class_file);
    EXPECT_EQ(classifier.classify("com/acme/Foo$Bar.class"), EntryCategory::class_file);
    EXPECT_EQ(classifier.classify("META-INF/MANIFEST.MF"), EntryCategory::resource);
    EXPECT_EQ(classifier.classify("config.properties"), EntryCategory::resource);
}

TEST(EntryClassifierTest, NestedArchivesAreResourcesUnlessEnabled) {
    EntryClassifier disabled{DecompilerOptions()};
    EXPECT_EQ(disabled.classify("lib/dep.jar"), EntryCategory::resource);

    EntryClassifier enabled{inner_jar_options()};
    EXPECT_EQ(enabled.classify("lib/dep.jar"), EntryCategory::nested_archive);
    EXPECT_EQ(enabled.classify("app.war"), EntryCategory::nested_archive);
    EXPECT_EQ(enabled.classify("bundle.ear"), EntryCategory::nested_archive);
    EXPECT_EQ(enabled.classify("data.zip"), EntryCategory::nested_archive);
    EXPECT_EQ(enabled.classify("LIB/UPPER.JAR"), EntryCategory::nested_archive);
    EXPECT_EQ(enabled.classify("notes.jarx"), EntryCategory::resource);
}

TEST(EntryClassifierTest, ClassSuffixWinsOverArchiveSuffix) {
    EntryClassifier classifier{inner_jar_options()};
    EXPECT_EQ(classifier.classify("weird.jar.class"), EntryCategory::class_file);
    EXPECT_EQ(classifier.classify("weird.class.jar"), EntryCategory::nested_archive);
}

TEST(EntryClassifierTest, SkipResourcesOnlyAffectsResources) {
    DecompilerOptions options = inner_jar_options();
    options.skip_resources = true;
    EntryClassifier classifier(options);

    EXPECT_EQ(classifier.classify("index.html"), EntryCategory::skipped);
    EXPECT_EQ(classifier.classify("Foo.class"), EntryCategory::class_file);
    EXPECT_EQ(classifier.classify("inner.jar"), EntryCategory::nested_archive);
}

TEST(EntryClassifierTest, ExcludePatternSkipsEverythingItMatches) {
    DecompilerOptions options = inner_jar_options();
    options.exclude_pattern = "com/internal/.*";
    EntryClassifier classifier(options);

    EXPECT_EQ(classifier.classify("com/internal/Secret.class"), EntryCategory::skipped);
    EXPECT_EQ(classifier.classify("com/internal/lib.jar"), EntryCategory::skipped);
    EXPECT_EQ(classifier.classify("com/public/Api.class"), EntryCategory::class_file);
}

TEST(EntryClassifierTest, IncludePatternMustMatchWholeName) {
    DecompilerOptions options;
    options.include_pattern = "com/acme/.*";
    EntryClassifier classifier(options);

    EXPECT_EQ(classifier.classify("com/acme/Foo.class"), EntryCategory::class_file);
    EXPECT_EQ(classifier.classify("org/com/acme/Foo.class"), EntryCategory::skipped);
    EXPECT_EQ(classifier.classify("README"), EntryCategory::skipped);
}

TEST(EntryClassifierTest, ExcludeIsCheckedBeforeInclude) {
    DecompilerOptions options;
    options.include_pattern = "com/.*";
    options.exclude_pattern = ".*Test\\.class";
    EntryClassifier classifier(options);

    EXPECT_EQ(classifier.classify("com/FooTest.class"), EntryCategory::skipped);
    EXPECT_EQ(classifier.classify("com/Foo.class"), EntryCategory::class_file);
}

TEST(EntryClassifierTest, InvalidPatternIsRejected) {
    DecompilerOptions options;
    options.include_pattern = "com/(unclosed";
    EXPECT_THROW(EntryClassifier classifier(options), std::invalid_argument);
}

TEST(EntryNameTest, ClassNameHelpers) {
    EXPECT_TRUE(is_class_file("a/B.class"));
    EXPECT_FALSE(is_class_file(".class"));
    EXPECT_FALSE(is_class_file("a/B.CLASS"));
    EXPECT_FALSE(is_class_file("a/B.classes"));

    EXPECT_EQ(cut_class_suffix("com/acme/Foo.class"), "com/acme/Foo");
    EXPECT_EQ(cut_class_suffix("com/acme/Foo"), "com/acme/Foo");

    EXPECT_TRUE(is_inner_class("com/acme/Foo$Bar"));
    EXPECT_TRUE(is_inner_class("com/acme/Foo$1"));
    EXPECT_FALSE(is_inner_class("com/acme/Foo"));
}

TEST(EntryNameTest, CategoryNames) {
    EXPECT_STREQ(to_string(EntryCategory::class_file), "class");
    EXPECT_STREQ(to_string(EntryCategory::nested_archive), "nested archive");
    EXPECT_STREQ(to_string(EntryCategory::resource), "resource");
    EXPECT_STREQ(to_string(EntryCategory::skipped), "skipped");
}
