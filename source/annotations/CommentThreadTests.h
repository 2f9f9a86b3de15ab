#ifndef COMMENTTHREADTESTS_H
#define COMMENTTHREADTESTS_H

#include <QObject>
#include <QRegularExpression>
#include <QTest>

#include "AnnotationTestFixtures.h"
#include "CommentThread.h"
#include "MemoryAnnotationStore.h"

/**
 * Unit tests for CommentThreadBuilder and CommentThreadNode.
 * Run with: markupview --test-thread
 */
class CommentThreadTests : public QObject {
    Q_OBJECT

private slots:
    void testNullRootGivesEmptyTree() {
        MemoryAnnotationStore store(1);
        AnnotationTestFixtures::addComment(store, 0, "Alice", "unrelated");

        CommentThreadBuildResult result = CommentThreadBuilder::build(nullptr, store.annotations(0));

        QVERIFY(result.root);
        QVERIFY(result.root->isSyntheticRoot());
        QCOMPARE(result.root->childCount(), 0);
        QVERIFY(!result.hasReplies);
    }

    void testRootWithoutReplies() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* root = AnnotationTestFixtures::addComment(store, 0, "Alice", "Hello");

        CommentThreadBuildResult result = CommentThreadBuilder::build(root, store.annotations(0));

        QVERIFY(!result.hasReplies);
        QCOMPARE(result.root->childCount(), 1);
        QCOMPARE(result.root->child(0)->annotation(), root);
        QVERIFY(result.root->child(0)->isLeaf());
        QCOMPARE(result.root->annotationCount(), 1);
    }

    void testNestedReplies() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* r = AnnotationTestFixtures::addComment(store, 0, "Alice", "root");
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(store, 0, "Bob", "a", r->ref);
        MarkupAnnotation* b = AnnotationTestFixtures::addComment(store, 0, "Carol", "b", a->ref);
        MarkupAnnotation* c = AnnotationTestFixtures::addComment(store, 0, "Dave", "c", r->ref);

        CommentThreadBuildResult result = CommentThreadBuilder::build(r, store.annotations(0));
        QVERIFY(result.hasReplies);

        const CommentThreadNode* top = result.root->child(0);
        QCOMPARE(top->annotation(), r);
        QCOMPARE(top->childCount(), 2);
        QCOMPARE(top->child(0)->annotation(), a);
        QCOMPARE(top->child(1)->annotation(), c);
        QCOMPARE(top->child(0)->childCount(), 1);
        QCOMPARE(top->child(0)->child(0)->annotation(), b);

        // Depth-first pre-order
        const QVector<AnnotationRef> expected = { r->ref, a->ref, b->ref, c->ref };
        QCOMPARE(result.root->refs(), expected);
    }

    void testPopupsAreNotNodes() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* r = AnnotationTestFixtures::addComment(store, 0, "Alice", "root");
        MarkupAnnotation* popup = AnnotationTestFixtures::addPopup(store, r);
        // A malformed popup carrying an IRT must still be ignored
        popup->inReplyTo = r->ref;

        QVERIFY(!CommentThreadBuilder::hasReplies(r, store.annotations(0)));
        CommentThreadBuildResult result = CommentThreadBuilder::build(r, store.annotations(0));
        QVERIFY(!result.hasReplies);
        QVERIFY(!result.root->contains(popup->ref));
    }

    void testOtherThreadsAreExcluded() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* r = AnnotationTestFixtures::addComment(store, 0, "Alice", "root");
        MarkupAnnotation* s = AnnotationTestFixtures::addComment(store, 0, "Eve", "other");
        MarkupAnnotation* t = AnnotationTestFixtures::addComment(store, 0, "Eve", "reply", s->ref);
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(store, 0, "Bob", "a", r->ref);

        CommentThreadBuildResult result = CommentThreadBuilder::build(r, store.annotations(0));
        QVERIFY(result.root->contains(a->ref));
        QVERIFY(!result.root->contains(s->ref));
        QVERIFY(!result.root->contains(t->ref));
        QCOMPARE(result.root->annotationCount(), 2);
    }

    void testBuildIsIdempotent() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* r = AnnotationTestFixtures::addComment(store, 0, "Alice", "root");
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(store, 0, "Bob", "a", r->ref);
        AnnotationTestFixtures::addComment(store, 0, "Carol", "b", a->ref);
        AnnotationTestFixtures::addComment(store, 0, "Dave", "c", r->ref);

        CommentThreadBuildResult first = CommentThreadBuilder::build(r, store.annotations(0));
        CommentThreadBuildResult second = CommentThreadBuilder::build(r, store.annotations(0));
        QCOMPARE(first.root->refs(), second.root->refs());
        QCOMPARE(first.hasReplies, second.hasReplies);
    }

    void testCyclicChainTerminates() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(store, 0, "Alice", "a");
        MarkupAnnotation* b = AnnotationTestFixtures::addComment(store, 0, "Bob", "b", a->ref);
        a->inReplyTo = b->ref;

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("IRT chain is cyclic"));
        CommentThreadBuildResult result = CommentThreadBuilder::build(a, store.annotations(0));

        QCOMPARE(result.root->annotationCount(), 2);
        QCOMPARE(result.root->child(0)->child(0)->annotation(), b);
        QVERIFY(result.root->child(0)->child(0)->isLeaf());
    }

    void testFindAndFirstLeaf() {
        MemoryAnnotationStore store(1);
        MarkupAnnotation* r = AnnotationTestFixtures::addComment(store, 0, "Alice", "root");
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(store, 0, "Bob", "a", r->ref);
        MarkupAnnotation* b = AnnotationTestFixtures::addComment(store, 0, "Carol", "b", a->ref);

        CommentThreadBuildResult result = CommentThreadBuilder::build(r, store.annotations(0));

        QCOMPARE(result.root->firstLeaf()->annotation(), b);
        QCOMPARE(result.root->find(a->ref)->parent()->annotation(), r);
        QVERIFY(!result.root->find(AnnotationRef()));
        QVERIFY(!result.root->find(AnnotationRef(999)));
        QVERIFY(result.root->containsAny({ AnnotationRef(999), b->ref }));
        QVERIFY(!result.root->containsAny({ AnnotationRef(999) }));
    }
};

#endif // COMMENTTHREADTESTS_H
