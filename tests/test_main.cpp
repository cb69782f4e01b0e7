#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QLoggingCategory>

// QTimer / queued 호출을 쓰는 테스트가 있어 QCoreApplication 이 필요
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QLoggingCategory::setFilterRules(QStringLiteral("disco.*.debug=false"));

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
